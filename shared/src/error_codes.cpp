#include "stowage/error_codes.hpp"

#include <array>

namespace stowage
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::WriteFailed, "write_failed"},
            {ErrorCode::WrongStatus, "wrong_status"},
            {ErrorCode::Locked, "locked"},
            {ErrorCode::ExceededBounds, "exceeded_bounds"},
            {ErrorCode::OffsetTooLarge, "offset_too_large"},
            {ErrorCode::TooLarge, "too_large"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace stowage
