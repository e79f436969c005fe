#pragma once

#include "stowage/protocol.hpp"

#include "sqlite_statement.hpp"

namespace stowage::server::rows
{

    // Column list matching record_from_row().
    inline constexpr const char *kRecordColumns =
        "id, status, file_name, file_hash, file_size, metadata, project, pipeline, last_activity, processing, "
        "storage_location";

    protocol::UploadRecord record_from_row(const sqlite::Statement &statement);

} // namespace stowage::server::rows
