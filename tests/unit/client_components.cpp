#include <cassert>
#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "stowage/client/config.hpp"
#include "stowage/client/http_client.hpp"
#include "stowage/client/logger.hpp"
#include "stowage/client/progress.hpp"
#include "stowage/client/retry.hpp"

using namespace stowage;
using namespace stowage::client;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "stowage-upload");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_config_parsing()
    {
        const auto config = parse({"scan.tar", "item-1", "item-2", "--project", "archive", "--pipeline", "scans",
                                   "--uploader", "jdoe", "--base-url", "http://uploads.local:8080", "--chunk-size",
                                   "1048576", "--log", "upload.log"});
        assert(config.file == "scan.tar");
        assert((config.items == std::vector<std::string>{"item-1", "item-2"}));
        assert(config.project == "archive");
        assert(config.pipeline == "scans");
        assert(config.uploader == "jdoe");
        assert(config.base_url == "http://uploads.local:8080");
        assert(config.chunk_size == 1048576);
        assert(config.attempts == 5);
        assert(config.log_path && *config.log_path == "upload.log");

        assert(parse_fails({"scan.tar", "--project", "a", "--pipeline", "b", "--uploader", "c", "--base-url", "d"}));
        assert(parse_fails({"scan.tar", "item", "--project", "a", "--pipeline", "b", "--uploader", "c"}));
        assert(parse_fails({"scan.tar", "item", "--project", "a", "--pipeline", "b", "--uploader", "c",
                            "--base-url", "d", "--chunk-size", "0"}));
        assert(parse_fails({"scan.tar", "item", "--project", "a", "--pipeline", "b", "--uploader", "c",
                            "--base-url", "d", "--chunk-size", "12abc"}));
        assert(parse_fails({"scan.tar", "item", "--frobnicate"}));
        assert(parse_fails({"scan.tar", "item", "--project"}));
    }

    void test_urls()
    {
        const auto plain = parse_url("http://uploads.local:8080/upload/abc?offset=5");
        assert(plain.host == "uploads.local");
        assert(plain.port == "8080");
        assert(plain.target == "/upload/abc?offset=5");

        const auto bare = parse_url("http://example.org");
        assert(bare.port == "80");
        assert(bare.target == "/");

        bool rejected = false;
        try
        {
            (void)parse_url("https://example.org/");
        }
        catch (const TransferError &ex)
        {
            rejected = ex.kind() == TransferErrorKind::ProtocolViolation;
        }
        assert(rejected);

        assert(join_url("http://h:1/", "upload") == "http://h:1/upload");
        assert(join_url("http://h:1/upload/abc", "data?offset=0") == "http://h:1/upload/abc/data?offset=0");
    }

    void test_error_classification()
    {
        assert(TransferError(TransferErrorKind::Transport, "reset").retryable());
        assert(TransferError(TransferErrorKind::BadStatusCode, "busy", 503).retryable());
        assert(TransferError(TransferErrorKind::BadStatusCode, "locked", 423).retryable());
        assert(!TransferError(TransferErrorKind::BadStatusCode, "bounds", 400).retryable());
        assert(!TransferError(TransferErrorKind::BadStatusCode, "missing", 404).retryable());
        assert(!TransferError(TransferErrorKind::BadStatusCode, "order", 409).retryable());
        assert(!TransferError(TransferErrorKind::UploadFailed, "FAILED_OTHER").retryable());
        assert(to_string(TransferErrorKind::JsonDecode) == "json_decode");
    }

    void test_retry_policy()
    {
        const RetryPolicy policy{};
        assert(policy.attempts == 7);
        assert(policy.delay_for(0) == std::chrono::seconds(1));
        assert(policy.delay_for(6) == std::chrono::seconds(64));
        const RetryPolicy capped{.attempts = 12, .base_delay = std::chrono::seconds(1), .max_delay = std::chrono::seconds(30)};
        assert(capped.delay_for(11) == std::chrono::seconds(30));

        Logger logger(std::nullopt);
        const RetryPolicy fast{.attempts = 4, .base_delay = std::chrono::milliseconds(0)};

        int calls = 0;
        const auto value = with_retry(fast, {}, logger, "flaky", [&]
                                      {
            if (++calls < 3) {
                throw TransferError(TransferErrorKind::BadStatusCode, "busy", 503);
            }
            return 42; });
        assert(value == 42);
        assert(calls == 3);

        calls = 0;
        bool permanent = false;
        try
        {
            with_retry(fast, {}, logger, "rejected", [&]
                       {
                ++calls;
                throw TransferError(TransferErrorKind::BadStatusCode, "bounds", 400); });
        }
        catch (const TransferError &ex)
        {
            permanent = ex.http_status() == 400;
        }
        assert(permanent);
        assert(calls == 1);

        calls = 0;
        bool exhausted = false;
        try
        {
            with_retry(fast, {}, logger, "down", [&]
                       {
                ++calls;
                throw TransferError(TransferErrorKind::Transport, "refused"); });
        }
        catch (const TransferError &ex)
        {
            exhausted = ex.kind() == TransferErrorKind::Exhausted;
        }
        assert(exhausted);
        assert(calls == 4);
    }

    void test_interruptible_sleep()
    {
        assert(interruptible_sleep(std::chrono::milliseconds(1), {}));

        std::stop_source stop;
        std::thread canceller([&]
                              {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            stop.request_stop(); });
        const auto started = std::chrono::steady_clock::now();
        assert(!interruptible_sleep(std::chrono::seconds(30), stop.get_token()));
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
        canceller.join();
    }

    void test_progress_reporter()
    {
        std::ostringstream out;
        {
            ProgressReporter progress(out, 200, std::chrono::milliseconds(5));
            progress.set_phase("Uploading 200 bytes.");
            progress.add_bytes(100);
            progress.add_bytes(100);
            progress.set_status(UploadStatus::Verifying);
            progress.stop();
            assert(progress.bytes_sent() == 200);
        }
        const auto text = out.str();
        assert(text.find("Uploading 200 bytes.") != std::string::npos);
        assert(text.find("Uploaded 200 of 200 bytes (100.0%)") != std::string::npos);
        assert(text.find("Item entered status VERIFYING.") != std::string::npos);
    }

} // namespace

void run_client_component_tests()
{
    test_config_parsing();
    test_urls();
    test_error_classification();
    test_retry_policy();
    test_interruptible_sleep();
    test_progress_reporter();
}
