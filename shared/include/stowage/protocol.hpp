/**
 * Stowage - Shared HTTP payload schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "stowage/status.hpp"

namespace stowage::protocol
{

    struct FileInfo
    {
        std::string name;
        std::string hash;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const FileInfo &file);
    void from_json(const nlohmann::json &json, FileInfo &file);

    struct UploadMetadata
    {
        std::string uploader;
        std::vector<std::string> items;
    };

    void to_json(nlohmann::json &json, const UploadMetadata &metadata);
    void from_json(const nlohmann::json &json, UploadMetadata &metadata);

    struct UploadRecord
    {
        std::string id;
        UploadStatus status{UploadStatus::Uploading};
        FileInfo file;
        UploadMetadata metadata;
        std::string project;
        std::string pipeline;
        // Unix seconds of the last accepted chunk or claim.
        std::uint64_t last_activity{};
        // Set while a worker holds the record.
        bool processing{};
        std::string storage_location;
    };

    void to_json(nlohmann::json &json, const UploadRecord &record);
    void from_json(const nlohmann::json &json, UploadRecord &record);

    struct UploadInitRequest
    {
        FileInfo file;
        std::string project;
        std::string pipeline;
        UploadMetadata metadata;
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInformation
    {
        std::string id;
        std::string base_url;
    };

    void to_json(nlohmann::json &json, const UploadInformation &info);
    void from_json(const nlohmann::json &json, UploadInformation &info);

    struct ClaimRequest
    {
        std::string project;
        std::string pipeline;
        UploadStatus status{UploadStatus::Verifying};
        bool processing{};
    };

    void to_json(nlohmann::json &json, const ClaimRequest &request);
    void from_json(const nlohmann::json &json, ClaimRequest &request);

    struct StatusUpdateRequest
    {
        UploadStatus status{UploadStatus::Finished};
    };

    void to_json(nlohmann::json &json, const StatusUpdateRequest &request);
    void from_json(const nlohmann::json &json, StatusUpdateRequest &request);

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        NotFound = 1,
        Err = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    // Every JSON response body is wrapped in this envelope. Errors carry a
    // human-readable message only.
    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        nlohmann::json payload{};
        std::string message{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    ResponseEnvelope make_ok(nlohmann::json payload = nullptr);
    ResponseEnvelope make_not_found();
    ResponseEnvelope make_error(std::string message);

    enum class EventKind : std::uint8_t
    {
        StatusChange
    };

    struct UploadEvent
    {
        EventKind kind{EventKind::StatusChange};
        UploadStatus status{UploadStatus::Uploading};
    };

    void to_json(nlohmann::json &json, const UploadEvent &event);
    void from_json(const nlohmann::json &json, UploadEvent &event);

} // namespace stowage::protocol
