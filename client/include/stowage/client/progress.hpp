#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <thread>

#include "stowage/status.hpp"

namespace stowage::client
{

    // Companion thread that prints byte progress while chunks are sent and
    // each new status while the driver waits on the event stream.
    class ProgressReporter
    {
    public:
        ProgressReporter(std::ostream &out, std::uint64_t total_bytes,
                         std::chrono::milliseconds interval = std::chrono::milliseconds(500));
        ~ProgressReporter();

        ProgressReporter(const ProgressReporter &) = delete;
        ProgressReporter &operator=(const ProgressReporter &) = delete;

        void add_bytes(std::uint64_t bytes) noexcept;
        void set_phase(std::string phase);
        void set_status(UploadStatus status);

        // Requests a stop and joins; the final line has been printed when
        // this returns.
        void stop();

        std::uint64_t bytes_sent() const noexcept { return sent_.load(); }

    private:
        void run(std::stop_token stop);
        void report(std::unique_lock<std::mutex> &lock);

        std::ostream &out_;
        const std::uint64_t total_;
        const std::chrono::milliseconds interval_;
        std::atomic<std::uint64_t> sent_{0};

        std::mutex mutex_;
        std::condition_variable_any wake_;
        std::string phase_;
        std::string printed_phase_;
        std::optional<UploadStatus> status_;
        std::optional<UploadStatus> printed_status_;
        std::uint64_t printed_bytes_{0};

        std::jthread thread_;
    };

} // namespace stowage::client
