#include "stowage/protocol.hpp"

#include <array>
#include <stdexcept>

namespace stowage::protocol
{

    namespace
    {

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "ok"},
            {ResponseKind::NotFound, "not_found"},
            {ResponseKind::Err, "err"},
        }};

        constexpr std::string_view kStatusChangeLabel = "status_change";

    } // namespace

    void to_json(nlohmann::json &json, const FileInfo &file)
    {
        json = {
            {"name", file.name},
            {"hash", file.hash},
            {"size", file.size},
        };
    }

    void from_json(const nlohmann::json &json, FileInfo &file)
    {
        file.name = json.at("name").get<std::string>();
        file.hash = json.at("hash").get<std::string>();
        file.size = json.at("size").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const UploadMetadata &metadata)
    {
        json = {
            {"uploader", metadata.uploader},
            {"items", metadata.items},
        };
    }

    void from_json(const nlohmann::json &json, UploadMetadata &metadata)
    {
        metadata.uploader = json.at("uploader").get<std::string>();
        metadata.items = json.value("items", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const UploadRecord &record)
    {
        json = {
            {"id", record.id},
            {"status", record.status},
            {"file", record.file},
            {"metadata", record.metadata},
            {"project", record.project},
            {"pipeline", record.pipeline},
            {"last_activity", record.last_activity},
            {"processing", record.processing},
            {"storage_location", record.storage_location},
        };
    }

    void from_json(const nlohmann::json &json, UploadRecord &record)
    {
        record.id = json.at("id").get<std::string>();
        record.status = json.at("status").get<UploadStatus>();
        record.file = json.at("file").get<FileInfo>();
        record.metadata = json.at("metadata").get<UploadMetadata>();
        record.project = json.value("project", std::string{});
        record.pipeline = json.value("pipeline", std::string{});
        record.last_activity = json.value("last_activity", 0ULL);
        record.processing = json.value("processing", false);
        record.storage_location = json.value("storage_location", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"file", request.file},
            {"project", request.project},
            {"pipeline", request.pipeline},
            {"metadata", request.metadata},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.file = json.at("file").get<FileInfo>();
        request.project = json.at("project").get<std::string>();
        request.pipeline = json.at("pipeline").get<std::string>();
        request.metadata = json.at("metadata").get<UploadMetadata>();
    }

    void to_json(nlohmann::json &json, const UploadInformation &info)
    {
        json = {
            {"id", info.id},
            {"base_url", info.base_url},
        };
    }

    void from_json(const nlohmann::json &json, UploadInformation &info)
    {
        info.id = json.at("id").get<std::string>();
        info.base_url = json.at("base_url").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ClaimRequest &request)
    {
        json = {
            {"project", request.project},
            {"pipeline", request.pipeline},
            {"status", request.status},
            {"processing", request.processing},
        };
    }

    void from_json(const nlohmann::json &json, ClaimRequest &request)
    {
        request.project = json.at("project").get<std::string>();
        request.pipeline = json.at("pipeline").get<std::string>();
        request.status = json.at("status").get<UploadStatus>();
        request.processing = json.value("processing", false);
    }

    void to_json(nlohmann::json &json, const StatusUpdateRequest &request)
    {
        json = {{"status", request.status}};
    }

    void from_json(const nlohmann::json &json, StatusUpdateRequest &request)
    {
        request.status = json.at("status").get<UploadStatus>();
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {{"status", to_string(envelope.kind)}};
        switch (envelope.kind)
        {
        case ResponseKind::Ok:
            json["payload"] = envelope.payload;
            break;
        case ResponseKind::Err:
            json["payload"] = envelope.message;
            break;
        case ResponseKind::NotFound:
            break;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.payload = nullptr;
        envelope.message.clear();
        const auto it = json.find("payload");
        if (it == json.end())
        {
            return;
        }
        if (envelope.kind == ResponseKind::Err)
        {
            envelope.message = it->is_string() ? it->get<std::string>() : it->dump();
        }
        else
        {
            envelope.payload = *it;
        }
    }

    ResponseEnvelope make_ok(nlohmann::json payload)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.payload = std::move(payload);
        return envelope;
    }

    ResponseEnvelope make_not_found()
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::NotFound;
        return envelope;
    }

    ResponseEnvelope make_error(std::string message)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Err;
        envelope.message = std::move(message);
        return envelope;
    }

    void to_json(nlohmann::json &json, const UploadEvent &event)
    {
        json = {
            {"type", kStatusChangeLabel},
            {"payload", event.status},
        };
    }

    void from_json(const nlohmann::json &json, UploadEvent &event)
    {
        const auto type = json.at("type").get<std::string>();
        if (type != kStatusChangeLabel)
        {
            throw std::runtime_error("Unknown event type: " + type);
        }
        event.kind = EventKind::StatusChange;
        event.status = json.at("payload").get<UploadStatus>();
    }

} // namespace stowage::protocol
