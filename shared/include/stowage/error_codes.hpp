/**
 * Stowage - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace stowage
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        WriteFailed = 2,
        WrongStatus = 3,
        Locked = 4,
        ExceededBounds = 5,
        OffsetTooLarge = 6,
        TooLarge = 7,
        AlreadyExists = 8,
        IoError = 9,
        InvalidPayload = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace stowage
