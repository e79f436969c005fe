#include "session_common.hpp"

namespace stowage::server::session_common
{

    namespace http = boost::beast::http;

    http::status http_status_for(stowage::ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return http::status::not_found;
        case ErrorCode::WrongStatus:
            return http::status::conflict;
        case ErrorCode::ExceededBounds:
        case ErrorCode::OffsetTooLarge:
        case ErrorCode::InvalidPayload:
            return http::status::bad_request;
        case ErrorCode::Locked:
            return http::status::locked;
        default:
            return http::status::internal_server_error;
        }
    }

    std::vector<std::string> split_path(std::string_view path)
    {
        std::vector<std::string> segments;
        std::size_t start = 0;
        while (start <= path.size())
        {
            const auto end = path.find('/', start);
            const auto length = (end == std::string_view::npos ? path.size() : end) - start;
            if (length > 0)
            {
                segments.emplace_back(path.substr(start, length));
            }
            if (end == std::string_view::npos)
            {
                break;
            }
            start = end + 1;
        }
        return segments;
    }

    std::optional<std::string> query_param(std::string_view query, std::string_view name)
    {
        std::size_t start = 0;
        while (start < query.size())
        {
            auto end = query.find('&', start);
            if (end == std::string_view::npos)
            {
                end = query.size();
            }
            const auto pair = query.substr(start, end - start);
            const auto eq = pair.find('=');
            if (pair.substr(0, eq) == name)
            {
                return eq == std::string_view::npos ? std::string{} : std::string(pair.substr(eq + 1));
            }
            start = end + 1;
        }
        return std::nullopt;
    }

} // namespace stowage::server::session_common
