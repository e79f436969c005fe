#pragma once

#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <memory>
#include <ostream>
#include <stop_token>
#include <string>

#include "stowage/client/config.hpp"
#include "stowage/client/http_client.hpp"
#include "stowage/client/logger.hpp"
#include "stowage/client/progress.hpp"
#include "stowage/client/retry.hpp"
#include "stowage/protocol.hpp"

namespace stowage::client
{

    enum class UploadOutcome
    {
        Finished,
        // The server rejected the content itself (FAILED_VERIFY).
        SourceRejected
    };

    // Handle on one initialized upload. Each call is a single HTTP exchange;
    // retries are the caller's concern.
    class RemoteUpload
    {
    public:
        RemoteUpload(HttpClient &http, protocol::UploadInformation info);

        static RemoteUpload initialize(HttpClient &http, const std::string &server_url,
                                       const protocol::UploadInitRequest &request);

        void upload_part(std::uint64_t offset, const std::string &bytes);
        void finish();
        std::unique_ptr<EventStream> subscribe();

        const std::string &id() const noexcept { return info_.id; }
        const std::string &base_url() const noexcept { return info_.base_url; }

    private:
        HttpClient &http_;
        protocol::UploadInformation info_;
    };

    struct DriverPolicies
    {
        RetryPolicy step{};
        RetryPolicy reconnect{.attempts = 12};
        RetryPolicy outer{.attempts = 5};
    };

    class TransferDriver
    {
    public:
        TransferDriver(ClientConfig config, HttpClient &http, Logger &logger, std::ostream &status_out,
                       DriverPolicies policies = {});
        ~TransferDriver();

        // Process exit code: 0 on success, 2 when the last attempt ended in a
        // verify rejection, 1 otherwise.
        int run(std::stop_token stop = {});

        // One pass: hash, initialize, send chunks, finish, wait for a terminal
        // status.
        UploadOutcome upload_once(std::stop_token stop);

        std::size_t rejections() const noexcept { return rejections_; }

    private:
        protocol::FileInfo describe_source();
        void send_chunks(RemoteUpload &upload, std::uint64_t size, ProgressReporter &progress, std::stop_token stop);
        UploadOutcome await_terminal(RemoteUpload &upload, ProgressReporter &progress, std::stop_token stop);

        ClientConfig config_;
        HttpClient &http_;
        Logger &logger_;
        std::ostream &status_out_;
        DriverPolicies policies_;
        boost::asio::thread_pool hash_pool_{1};
        std::size_t rejections_{0};
    };

} // namespace stowage::client
