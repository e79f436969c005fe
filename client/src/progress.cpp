#include "stowage/client/progress.hpp"

#include <iomanip>

namespace stowage::client
{

    namespace
    {

        double percent(std::uint64_t sent, std::uint64_t total)
        {
            if (total == 0)
            {
                return 100.0;
            }
            return 100.0 * static_cast<double>(sent) / static_cast<double>(total);
        }

    } // namespace

    ProgressReporter::ProgressReporter(std::ostream &out, std::uint64_t total_bytes,
                                       std::chrono::milliseconds interval)
        : out_(out), total_(total_bytes), interval_(interval),
          thread_([this](std::stop_token stop)
                  { run(stop); }) {}

    ProgressReporter::~ProgressReporter()
    {
        stop();
    }

    void ProgressReporter::add_bytes(std::uint64_t bytes) noexcept
    {
        sent_.fetch_add(bytes);
    }

    void ProgressReporter::set_phase(std::string phase)
    {
        {
            std::lock_guard lock(mutex_);
            phase_ = std::move(phase);
        }
        wake_.notify_all();
    }

    void ProgressReporter::set_status(UploadStatus status)
    {
        {
            std::lock_guard lock(mutex_);
            status_ = status;
        }
        wake_.notify_all();
    }

    void ProgressReporter::stop()
    {
        if (thread_.joinable())
        {
            thread_.request_stop();
            thread_.join();
        }
    }

    void ProgressReporter::run(std::stop_token stop)
    {
        std::unique_lock lock(mutex_);
        while (!stop.stop_requested())
        {
            wake_.wait_for(lock, stop, interval_, [this]
                           { return status_ != printed_status_ || phase_ != printed_phase_; });
            report(lock);
        }
        report(lock);
    }

    void ProgressReporter::report(std::unique_lock<std::mutex> &)
    {
        const auto sent = sent_.load();
        if (sent != printed_bytes_)
        {
            out_ << "Uploaded " << sent << " of " << total_ << " bytes (" << std::fixed << std::setprecision(1)
                 << percent(sent, total_) << "%)\n";
            printed_bytes_ = sent;
        }
        if (phase_ != printed_phase_)
        {
            out_ << phase_ << "\n";
            printed_phase_ = phase_;
        }
        if (status_ && status_ != printed_status_)
        {
            out_ << "Item entered status " << to_string(*status_) << ".\n";
            printed_status_ = status_;
        }
        out_.flush();
    }

} // namespace stowage::client
