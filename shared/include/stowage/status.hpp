/**
 * Stowage - Upload lifecycle states.
 *
 * UPLOADING is the only entry state. The client moves a record to VERIFYING
 * (or a pipeline moves it to PENDING) once every byte has been sent; workers
 * then drive it through the optional DERIVING/PACKING stages to one of the
 * terminal states. Nothing ever moves back into UPLOADING.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stowage
{

    enum class UploadStatus : std::uint8_t
    {
        Uploading,
        Verifying,
        Pending,
        Deriving,
        Packing,
        Finished,
        Abandoned,
        FailedChecksum,
        FailedVerify,
        FailedOther
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> status_from_string(std::string_view value) noexcept;

    bool is_terminal(UploadStatus status) noexcept;

    // FAILED_CHECKSUM, FAILED_VERIFY or FAILED_OTHER.
    bool is_failure(UploadStatus status) noexcept;

    void to_json(nlohmann::json &json, const UploadStatus &status);
    void from_json(const nlohmann::json &json, UploadStatus &status);

} // namespace stowage
