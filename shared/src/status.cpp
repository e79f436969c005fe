#include "stowage/status.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace stowage
{

    namespace
    {

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 10> kStatusMappings{{
            {UploadStatus::Uploading, "UPLOADING"},
            {UploadStatus::Verifying, "VERIFYING"},
            {UploadStatus::Pending, "PENDING"},
            {UploadStatus::Deriving, "DERIVING"},
            {UploadStatus::Packing, "PACKING"},
            {UploadStatus::Finished, "FINISHED"},
            {UploadStatus::Abandoned, "ABANDONED"},
            {UploadStatus::FailedChecksum, "FAILED_CHECKSUM"},
            {UploadStatus::FailedVerify, "FAILED_VERIFY"},
            {UploadStatus::FailedOther, "FAILED_OTHER"},
        }};

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<UploadStatus> status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Finished || status == UploadStatus::Abandoned || is_failure(status);
    }

    bool is_failure(UploadStatus status) noexcept
    {
        return status == UploadStatus::FailedChecksum || status == UploadStatus::FailedVerify ||
               status == UploadStatus::FailedOther;
    }

    void to_json(nlohmann::json &json, const UploadStatus &status)
    {
        json = std::string(to_string(status));
    }

    void from_json(const nlohmann::json &json, UploadStatus &status)
    {
        const auto label = json.get<std::string>();
        auto parsed = status_from_string(label);
        if (!parsed)
        {
            throw std::runtime_error("Unknown upload status: " + label);
        }
        status = *parsed;
    }

} // namespace stowage
