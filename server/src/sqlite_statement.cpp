#include "sqlite_statement.hpp"

namespace stowage::server::sqlite
{

    Statement::Statement(sqlite3 *db, std::string_view sql)
        : db_(db)
    {
        const auto rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
        if (rc != SQLITE_OK)
        {
            throw SqliteError(rc, std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    Statement::~Statement()
    {
        sqlite3_finalize(stmt_);
    }

    void Statement::bind(int index, std::string_view value)
    {
        const auto rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
        {
            throw SqliteError(rc, std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    void Statement::bind(int index, std::int64_t value)
    {
        const auto rc = sqlite3_bind_int64(stmt_, index, value);
        if (rc != SQLITE_OK)
        {
            throw SqliteError(rc, std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    bool Statement::step()
    {
        const auto rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
        {
            return true;
        }
        if (rc == SQLITE_DONE)
        {
            return false;
        }
        throw SqliteError(rc, std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string Statement::column_text(int index) const
    {
        const auto *text = sqlite3_column_text(stmt_, index);
        if (text == nullptr)
        {
            return {};
        }
        return std::string(reinterpret_cast<const char *>(text),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
    }

    std::int64_t Statement::column_int(int index) const
    {
        return sqlite3_column_int64(stmt_, index);
    }

    void execute(sqlite3 *db, const char *sql)
    {
        char *error = nullptr;
        const auto rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
        if (rc != SQLITE_OK)
        {
            std::string message = error != nullptr ? error : sqlite3_errmsg(db);
            sqlite3_free(error);
            throw SqliteError(rc, message);
        }
    }

    int changes(sqlite3 *db) noexcept
    {
        return sqlite3_changes(db);
    }

} // namespace stowage::server::sqlite
