#include "stowage/server/record_store.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "record_rows.hpp"
#include "sqlite_statement.hpp"

namespace stowage::server
{

    namespace
    {

        std::string select_by_id_sql()
        {
            return std::string("SELECT ") + rows::kRecordColumns + " FROM uploads WHERE id = ?1";
        }

        std::int64_t as_int(std::uint64_t value)
        {
            return static_cast<std::int64_t>(value);
        }

        [[noreturn]] void throw_not_found(const std::string &id)
        {
            throw StoreError(ErrorCode::NotFound, "Upload " + id + " not found");
        }

    } // namespace

    RecordStore::RecordStore(ConnectionPool &pool, ChangeFeed &feed)
        : pool_(pool), feed_(feed) {}

    std::uint64_t RecordStore::now()
    {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
    }

    protocol::UploadRecord RecordStore::create(const std::string &id, const protocol::FileInfo &file,
                                               const std::string &project, const std::string &pipeline,
                                               const protocol::UploadMetadata &metadata,
                                               const std::string &storage_location)
    {
        protocol::UploadRecord record{
            .id = id,
            .status = UploadStatus::Uploading,
            .file = file,
            .metadata = metadata,
            .project = project,
            .pipeline = pipeline,
            .last_activity = now(),
            .processing = false,
            .storage_location = storage_location,
        };

        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement insert(connection.get(),
                                     "INSERT INTO uploads (id, status, file_name, file_hash, file_size, metadata, "
                                     "project, pipeline, last_activity, processing, storage_location) "
                                     "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, 0, ?10)");
            insert.bind(1, record.id);
            insert.bind(2, to_string(record.status));
            insert.bind(3, record.file.name);
            insert.bind(4, record.file.hash);
            insert.bind(5, as_int(record.file.size));
            insert.bind(6, nlohmann::json(record.metadata).dump());
            insert.bind(7, record.project);
            insert.bind(8, record.pipeline);
            insert.bind(9, as_int(record.last_activity));
            insert.bind(10, record.storage_location);
            insert.step();
            if (sqlite::changes(connection.get()) != 1)
            {
                throw StoreError(ErrorCode::WriteFailed, "Insert of upload " + id + " affected no rows");
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::WriteFailed, "Failed to create upload " + id + ": " + ex.what());
        }
        return record;
    }

    protocol::UploadRecord RecordStore::get(const std::string &id)
    {
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement select(connection.get(), select_by_id_sql());
            select.bind(1, id);
            if (!select.step())
            {
                throw_not_found(id);
            }
            return rows::record_from_row(select);
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::InternalError, "Failed to load upload " + id + ": " + ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw StoreError(ErrorCode::InternalError, "Corrupt metadata for upload " + id + ": " + ex.what());
        }
    }

    void RecordStore::touch(const std::string &id)
    {
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement update(connection.get(), "UPDATE uploads SET last_activity = ?1 WHERE id = ?2");
            update.bind(1, as_int(now()));
            update.bind(2, id);
            update.step();
            if (sqlite::changes(connection.get()) == 0)
            {
                throw_not_found(id);
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::WriteFailed, "Failed to touch upload " + id + ": " + ex.what());
        }
    }

    void RecordStore::transition(const std::string &id, UploadStatus expected, UploadStatus next)
    {
        if (next == UploadStatus::Uploading)
        {
            throw StoreError(ErrorCode::WrongStatus, "Uploads cannot return to UPLOADING");
        }

        std::lock_guard publish_lock(publish_mutex_);
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement update(connection.get(), "UPDATE uploads SET status = ?1 WHERE id = ?2 AND status = ?3");
            update.bind(1, to_string(next));
            update.bind(2, id);
            update.bind(3, to_string(expected));
            update.step();
            if (sqlite::changes(connection.get()) == 0)
            {
                sqlite::Statement select(connection.get(), "SELECT status FROM uploads WHERE id = ?1");
                select.bind(1, id);
                if (!select.step())
                {
                    throw_not_found(id);
                }
                throw StoreError(ErrorCode::WrongStatus, "Upload " + id + " is " + select.column_text(0) +
                                                             ", expected " + std::string(to_string(expected)));
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::WriteFailed, "Failed to update upload " + id + ": " + ex.what());
        }

        spdlog::info("Upload {} moved {} -> {}", id, to_string(expected), to_string(next));
        feed_.publish(id, next);
    }

    void RecordStore::set_status_and_release(const std::string &id, UploadStatus status)
    {
        if (status == UploadStatus::Uploading)
        {
            throw StoreError(ErrorCode::WrongStatus, "Uploads cannot return to UPLOADING");
        }

        std::lock_guard publish_lock(publish_mutex_);
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement select(connection.get(), "SELECT status FROM uploads WHERE id = ?1");
            select.bind(1, id);
            if (!select.step())
            {
                throw_not_found(id);
            }
            const auto current_label = select.column_text(0);
            const auto current = status_from_string(current_label);
            if (current && is_terminal(*current))
            {
                throw StoreError(ErrorCode::WrongStatus, "Upload " + id + " already ended in " + current_label);
            }

            sqlite::Statement update(connection.get(),
                                     "UPDATE uploads SET status = ?1, processing = 0 WHERE id = ?2 AND status = ?3");
            update.bind(1, to_string(status));
            update.bind(2, id);
            update.bind(3, current_label);
            update.step();
            if (sqlite::changes(connection.get()) == 0)
            {
                throw StoreError(ErrorCode::WrongStatus, "Upload " + id + " changed status concurrently");
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::WriteFailed, "Failed to update upload " + id + ": " + ex.what());
        }

        spdlog::info("Upload {} set to {} and released", id, to_string(status));
        feed_.publish(id, status);
    }

    std::shared_ptr<StatusSubscription> RecordStore::watch(const std::string &id)
    {
        std::lock_guard publish_lock(publish_mutex_);
        const auto record = get(id);
        return feed_.subscribe(id, record.status);
    }

    std::vector<std::string> RecordStore::find_idle(UploadStatus status, std::uint64_t inactive_since)
    {
        std::vector<std::string> ids;
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement select(connection.get(),
                                     "SELECT id FROM uploads WHERE status = ?1 AND last_activity < ?2 ORDER BY id");
            select.bind(1, to_string(status));
            select.bind(2, as_int(inactive_since));
            while (select.step())
            {
                ids.push_back(select.column_text(0));
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::InternalError, std::string("Failed to scan idle uploads: ") + ex.what());
        }
        return ids;
    }

} // namespace stowage::server
