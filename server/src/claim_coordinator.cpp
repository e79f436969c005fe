#include "stowage/server/claim_coordinator.hpp"

#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "record_rows.hpp"
#include "sqlite_statement.hpp"
#include "stowage/server/record_store.hpp"

namespace stowage::server
{

    namespace
    {

        std::string claim_sql()
        {
            return std::string(R"SQL(
                UPDATE uploads SET processing = 1, last_activity = ?1
                WHERE id = (
                    SELECT id FROM uploads
                    WHERE project = ?2 AND pipeline = ?3 AND status = ?4 AND processing = ?5
                      AND (?5 = 0 OR last_activity < ?6)
                    ORDER BY id
                    LIMIT 1)
                  AND processing = ?5
                RETURNING )SQL") +
                   rows::kRecordColumns;
        }

    } // namespace

    ClaimCoordinator::ClaimCoordinator(ConnectionPool &pool)
        : pool_(pool) {}

    std::optional<protocol::UploadRecord> ClaimCoordinator::claim(const std::string &project,
                                                                  const std::string &pipeline, UploadStatus status,
                                                                  bool want_processing)
    {
        const auto now = RecordStore::now();
        const auto grace = static_cast<std::uint64_t>(kReclaimGrace.count());
        const auto stale_before = now > grace ? now - grace : 0;

        std::optional<protocol::UploadRecord> claimed;
        try
        {
            auto connection = pool_.acquire();
            sqlite::Statement update(connection.get(), claim_sql());
            update.bind(1, static_cast<std::int64_t>(now));
            update.bind(2, project);
            update.bind(3, pipeline);
            update.bind(4, to_string(status));
            update.bind(5, std::int64_t{want_processing ? 1 : 0});
            update.bind(6, static_cast<std::int64_t>(stale_before));
            if (update.step())
            {
                claimed = rows::record_from_row(update);
            }
        }
        catch (const sqlite::SqliteError &ex)
        {
            throw StoreError(ErrorCode::WriteFailed, std::string("Claim failed: ") + ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw StoreError(ErrorCode::InternalError, std::string("Claimed record is corrupt: ") + ex.what());
        }

        if (claimed)
        {
            spdlog::info("Claimed upload {} ({}/{} {}{})", claimed->id, project, pipeline, to_string(status),
                         want_processing ? ", reclaimed" : "");
        }
        return claimed;
    }

} // namespace stowage::server
