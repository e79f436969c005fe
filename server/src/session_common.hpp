#pragma once

#include <ostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/status.hpp>

#include "stowage/error_codes.hpp"

namespace stowage::server::session_common
{

    // HTTP status for a failed request. The envelope only carries a message;
    // the status code is what tells a client whether retrying can help.
    boost::beast::http::status http_status_for(stowage::ErrorCode code) noexcept;

    std::vector<std::string> split_path(std::string_view path);

    std::optional<std::string> query_param(std::string_view query, std::string_view name);

} // namespace stowage::server::session_common
