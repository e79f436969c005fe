#include "record_rows.hpp"

#include <nlohmann/json.hpp>

#include "stowage/server/errors.hpp"

namespace stowage::server::rows
{

    protocol::UploadRecord record_from_row(const sqlite::Statement &statement)
    {
        protocol::UploadRecord record;
        record.id = statement.column_text(0);
        const auto status_label = statement.column_text(1);
        const auto status = status_from_string(status_label);
        if (!status)
        {
            throw StoreError(ErrorCode::InternalError,
                             "Stored record " + record.id + " has unknown status " + status_label);
        }
        record.status = *status;
        record.file.name = statement.column_text(2);
        record.file.hash = statement.column_text(3);
        record.file.size = static_cast<std::uint64_t>(statement.column_int(4));
        record.metadata = nlohmann::json::parse(statement.column_text(5)).get<protocol::UploadMetadata>();
        record.project = statement.column_text(6);
        record.pipeline = statement.column_text(7);
        record.last_activity = static_cast<std::uint64_t>(statement.column_int(8));
        record.processing = statement.column_int(9) != 0;
        record.storage_location = statement.column_text(10);
        return record;
    }

} // namespace stowage::server::rows
