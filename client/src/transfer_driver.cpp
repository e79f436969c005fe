#include "stowage/client/transfer_driver.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>

#include "stowage/crypto.hpp"

namespace stowage::client
{

    RemoteUpload::RemoteUpload(HttpClient &http, protocol::UploadInformation info)
        : http_(http), info_(std::move(info)) {}

    RemoteUpload RemoteUpload::initialize(HttpClient &http, const std::string &server_url,
                                          const protocol::UploadInitRequest &request)
    {
        const auto payload = http.post_json(join_url(server_url, "upload"), request, 201);
        try
        {
            return RemoteUpload(http, payload.get<protocol::UploadInformation>());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(TransferErrorKind::BadResponse, std::string("Bad upload information: ") + ex.what());
        }
    }

    void RemoteUpload::upload_part(std::uint64_t offset, const std::string &bytes)
    {
        http_.put_bytes(join_url(info_.base_url, "data?offset=" + std::to_string(offset)), bytes, 201);
    }

    void RemoteUpload::finish()
    {
        http_.call(boost::beast::http::verb::post, join_url(info_.base_url, "finish"), {}, {}, 202);
    }

    std::unique_ptr<EventStream> RemoteUpload::subscribe()
    {
        return http_.open_events(join_url(info_.base_url, "events"));
    }

    TransferDriver::TransferDriver(ClientConfig config, HttpClient &http, Logger &logger, std::ostream &status_out,
                                   DriverPolicies policies)
        : config_(std::move(config)), http_(http), logger_(logger), status_out_(status_out),
          policies_(std::move(policies))
    {
        policies_.outer.attempts = config_.attempts;
    }

    TransferDriver::~TransferDriver()
    {
        hash_pool_.join();
    }

    int TransferDriver::run(std::stop_token stop)
    {
        bool last_rejected = false;
        for (std::size_t attempt = 0; attempt < policies_.outer.attempts; ++attempt)
        {
            try
            {
                if (upload_once(stop) == UploadOutcome::Finished)
                {
                    logger_.log("info", "upload of ", config_.file.string(), " finished");
                    status_out_ << "Upload finished." << std::endl;
                    return 0;
                }
                ++rejections_;
                last_rejected = true;
                logger_.log("error", "source rejected by verification (", rejections_, " so far)");
                status_out_ << "Hash verification failed, retrying." << std::endl;
            }
            catch (const TransferError &ex)
            {
                last_rejected = false;
                logger_.log("error", "attempt ", attempt + 1, " failed (", to_string(ex.kind()), "): ", ex.what());
                status_out_ << "Upload attempt failed: " << ex.what() << std::endl;
                if (ex.kind() == TransferErrorKind::ProtocolViolation ||
                    (ex.kind() == TransferErrorKind::BadStatusCode && !ex.retryable()))
                {
                    break;
                }
            }
            catch (const std::runtime_error &ex)
            {
                last_rejected = false;
                logger_.log("error", "attempt ", attempt + 1, " failed: ", ex.what());
                status_out_ << "Upload attempt failed: " << ex.what() << std::endl;
            }

            if (stop.stop_requested() || attempt + 1 == policies_.outer.attempts)
            {
                break;
            }
            if (!interruptible_sleep(policies_.outer.delay_for(attempt), stop))
            {
                break;
            }
        }
        status_out_ << "Upload failed." << std::endl;
        return last_rejected ? 2 : 1;
    }

    UploadOutcome TransferDriver::upload_once(std::stop_token stop)
    {
        const auto file = describe_source();
        logger_.log("info", "hashed ", file.name, ": ", file.hash, " (", file.size, " bytes)");

        const protocol::UploadInitRequest request{
            .file = file,
            .project = config_.project,
            .pipeline = config_.pipeline,
            .metadata = {.uploader = config_.uploader, .items = config_.items},
        };
        auto upload = with_retry(policies_.step, stop, logger_, "init", [&]
                                 { return RemoteUpload::initialize(http_, config_.base_url, request); });
        logger_.log("info", "upload id ", upload.id(), " at ", upload.base_url());
        status_out_ << "Upload ID: " << upload.id() << std::endl;

        ProgressReporter progress(status_out_, file.size);
        progress.set_phase("Uploading " + std::to_string(file.size) + " bytes.");
        send_chunks(upload, file.size, progress, stop);

        progress.set_phase("Finalizing upload...");
        with_retry(policies_.step, stop, logger_, "finish", [&]
                   { upload.finish(); });

        const auto outcome = await_terminal(upload, progress, stop);
        progress.stop();
        return outcome;
    }

    protocol::FileInfo TransferDriver::describe_source()
    {
        const auto &path = config_.file;
        const auto size = std::filesystem::file_size(path);

        std::packaged_task<std::string()> task([path]
                                               { return crypto::hash_file(path); });
        auto digest = task.get_future();
        boost::asio::post(hash_pool_, std::move(task));

        return protocol::FileInfo{
            .name = path.filename().string(),
            .hash = digest.get(),
            .size = size,
        };
    }

    void TransferDriver::send_chunks(RemoteUpload &upload, std::uint64_t size, ProgressReporter &progress,
                                     std::stop_token stop)
    {
        std::ifstream input(config_.file, std::ios::binary);
        if (!input)
        {
            throw std::runtime_error("Cannot open " + config_.file.string());
        }

        std::uint64_t offset = 0;
        std::string chunk;
        while (offset < size)
        {
            const auto length = std::min<std::uint64_t>(config_.chunk_size, size - offset);
            chunk.resize(static_cast<std::size_t>(length));
            input.read(chunk.data(), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(input.gcount()) != length)
            {
                throw std::runtime_error("Source file changed while uploading " + config_.file.string());
            }

            with_retry(policies_.step, stop, logger_, "chunk at offset " + std::to_string(offset), [&]
                       { upload.upload_part(offset, chunk); });
            offset += length;
            progress.add_bytes(length);
        }
    }

    UploadOutcome TransferDriver::await_terminal(RemoteUpload &upload, ProgressReporter &progress,
                                                 std::stop_token stop)
    {
        std::size_t reconnects = 0;
        while (true)
        {
            if (stop.stop_requested())
            {
                throw_cancelled("status wait");
            }
            try
            {
                auto events = upload.subscribe();
                while (auto event = events->next())
                {
                    const auto status = event->status;
                    logger_.log("info", "upload ", upload.id(), " entered ", to_string(status));
                    progress.set_status(status);
                    if (status == UploadStatus::Finished)
                    {
                        return UploadOutcome::Finished;
                    }
                    if (status == UploadStatus::FailedVerify)
                    {
                        return UploadOutcome::SourceRejected;
                    }
                    if (is_terminal(status))
                    {
                        throw TransferError(TransferErrorKind::UploadFailed,
                                            "Upload ended with status " + std::string(to_string(status)));
                    }
                }
                logger_.log("retry", "event stream ended before a terminal status");
            }
            catch (const TransferError &ex)
            {
                if (ex.kind() == TransferErrorKind::UploadFailed || !ex.retryable())
                {
                    throw;
                }
                logger_.log("retry", "event stream failed: ", ex.what());
            }

            if (reconnects >= policies_.reconnect.attempts)
            {
                throw TransferError(TransferErrorKind::Exhausted, "Event stream failed after " +
                                                                      std::to_string(reconnects) + " reconnects");
            }
            if (!interruptible_sleep(policies_.reconnect.delay_for(reconnects), stop))
            {
                throw_cancelled("status wait");
            }
            ++reconnects;
        }
    }

} // namespace stowage::client
