/**
 * Stowage - Newline-delimited JSON framing helpers.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stowage::protocol
{

    struct DecodedLine
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::string encode_line(const nlohmann::json &message);

    // Returns the first complete line in buffer, skipping blank ones.
    std::optional<DecodedLine> try_decode_line(std::string_view buffer);

} // namespace stowage::protocol
