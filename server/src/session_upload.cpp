#include "stowage/server/session.hpp"

#include <charconv>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace stowage::server
{

    namespace http = boost::beast::http;

    namespace
    {

        std::optional<std::uint64_t> parse_offset(const std::string &value)
        {
            std::uint64_t offset = 0;
            const auto *begin = value.data();
            const auto *end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(begin, end, offset);
            if (ec != std::errc{} || ptr != end || value.empty())
            {
                return std::nullopt;
            }
            return offset;
        }

    } // namespace

    void Session::handle_new_upload()
    {
        try
        {
            services_.uploads.abandon_expired(services_.upload_timeout);
            const auto request = nlohmann::json::parse(json_body_).get<protocol::UploadInitRequest>();
            const auto record = services_.uploads.initialize(request);

            protocol::UploadInformation info{
                .id = record.id,
                .base_url = base_url_for(record.id),
            };
            send_envelope(http::status::created, protocol::make_ok(info));
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Upload init from {} failed: {}", remote_endpoint(), ex.what());
            send_error(ex);
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Malformed upload init from {}: {}", remote_endpoint(), ex.what());
            send_error(UploadError(ErrorCode::InvalidPayload, ex.what()));
        }
    }

    void Session::handle_get_upload(const std::string &id)
    {
        try
        {
            send_envelope(http::status::ok, protocol::make_ok(services_.uploads.get(id)));
        }
        catch (const UploadError &ex)
        {
            send_error(ex);
        }
    }

    void Session::begin_put_data(const std::string &id)
    {
        const auto offset_text = session_common::query_param(query_, "offset");
        const auto offset = offset_text ? parse_offset(*offset_text) : std::nullopt;
        if (!offset)
        {
            send_error(UploadError(ErrorCode::InvalidPayload, "Missing or invalid offset parameter"));
            return;
        }
        try
        {
            range_writer_.emplace(services_.uploads.begin_chunk(id, *offset));
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Chunk for {} at offset {} rejected: {}", id, *offset, ex.what());
            send_error(ex);
        }
    }

    void Session::finish_put_data()
    {
        const auto written = range_writer_->bytes_written();
        const auto offset = range_writer_->offset();
        range_writer_.reset();
        spdlog::debug("Wrote {} bytes to {} at offset {}", written, upload_id_, offset);
        send_envelope(http::status::created, protocol::make_ok());
    }

    void Session::handle_finish(const std::string &id)
    {
        try
        {
            services_.uploads.finish(id);
            spdlog::info("Finish accepted for {}", id);
            send_envelope(http::status::accepted, protocol::make_ok());
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Finish for {} rejected: {}", id, ex.what());
            send_error(ex);
        }
    }

    void Session::handle_abandon(const std::string &id)
    {
        try
        {
            services_.uploads.abandon(id);
            spdlog::info("Upload {} abandoned by request", id);
            send_envelope(http::status::ok, protocol::make_ok());
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Abandon of {} rejected: {}", id, ex.what());
            send_error(ex);
        }
    }

} // namespace stowage::server
