#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sqlite3.h>

namespace stowage::server::sqlite
{

    class SqliteError : public std::runtime_error
    {
    public:
        SqliteError(int result_code, const std::string &message)
            : std::runtime_error(message), result_code_(result_code) {}

        int result_code() const noexcept { return result_code_; }

    private:
        int result_code_;
    };

    // Owns a prepared statement; binds are 1-based like the C API.
    class Statement
    {
    public:
        Statement(sqlite3 *db, std::string_view sql);
        ~Statement();

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void bind(int index, std::string_view value);
        void bind(int index, std::int64_t value);

        // True when a row is available, false once the statement is done.
        bool step();

        std::string column_text(int index) const;
        std::int64_t column_int(int index) const;

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_{nullptr};
    };

    void execute(sqlite3 *db, const char *sql);

    // Number of rows modified by the most recent statement on db.
    int changes(sqlite3 *db) noexcept;

} // namespace stowage::server::sqlite
