#include "stowage/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace stowage::server
{

    namespace http = boost::beast::http;

    void Session::handle_claim()
    {
        try
        {
            const auto request = nlohmann::json::parse(json_body_).get<protocol::ClaimRequest>();
            const auto record = services_.uploads.claim(request);
            nlohmann::json payload = nullptr;
            if (record)
            {
                payload = *record;
            }
            send_envelope(http::status::ok, protocol::make_ok(std::move(payload)));
        }
        catch (const UploadError &ex)
        {
            spdlog::error("Claim from {} failed: {}", remote_endpoint(), ex.what());
            send_error(ex);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(UploadError(ErrorCode::InvalidPayload, ex.what()));
        }
        catch (const std::runtime_error &ex)
        {
            // Unknown status label.
            send_error(UploadError(ErrorCode::InvalidPayload, ex.what()));
        }
    }

    void Session::handle_update_status(const std::string &id)
    {
        try
        {
            const auto request = nlohmann::json::parse(json_body_).get<protocol::StatusUpdateRequest>();
            services_.uploads.update_status(id, request.status);
            send_envelope(http::status::ok, protocol::make_ok());
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Status update for {} rejected: {}", id, ex.what());
            send_error(ex);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(UploadError(ErrorCode::InvalidPayload, ex.what()));
        }
        catch (const std::runtime_error &ex)
        {
            send_error(UploadError(ErrorCode::InvalidPayload, ex.what()));
        }
    }

} // namespace stowage::server
