#include "stowage/server/connection_pool.hpp"

#include <sqlite3.h>

#include <spdlog/spdlog.h>

#include "sqlite_statement.hpp"

namespace stowage::server
{

    namespace
    {

        constexpr const char *kSchema = R"SQL(
            CREATE TABLE IF NOT EXISTS uploads (
                id               TEXT PRIMARY KEY,
                status           TEXT NOT NULL,
                file_name        TEXT NOT NULL,
                file_hash        TEXT NOT NULL,
                file_size        INTEGER NOT NULL,
                metadata         TEXT NOT NULL,
                project          TEXT NOT NULL,
                pipeline         TEXT NOT NULL,
                last_activity    INTEGER NOT NULL,
                processing       INTEGER NOT NULL DEFAULT 0,
                storage_location TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS uploads_claim
                ON uploads (project, pipeline, status, processing);
        )SQL";

    } // namespace

    PooledConnection::PooledConnection(ConnectionPool &pool, sqlite3 *handle) noexcept
        : pool_(&pool), handle_(handle) {}

    PooledConnection::~PooledConnection()
    {
        pool_->release(handle_);
    }

    ConnectionPool::ConnectionPool(std::filesystem::path database_path, std::size_t max_size)
        : database_path_(std::move(database_path)), max_size_(max_size == 0 ? 1 : max_size)
    {
        if (database_path_.has_parent_path())
        {
            std::filesystem::create_directories(database_path_.parent_path());
        }
        auto *first = open_connection();
        try
        {
            sqlite::execute(first, kSchema);
        }
        catch (...)
        {
            sqlite3_close(first);
            throw;
        }
        idle_.push_back(first);
        opened_ = 1;
        spdlog::info("Opened upload database {} (pool size {})", database_path_.string(), max_size_);
    }

    ConnectionPool::~ConnectionPool()
    {
        std::lock_guard lock(mutex_);
        for (auto *handle : idle_)
        {
            sqlite3_close(handle);
        }
        idle_.clear();
    }

    PooledConnection ConnectionPool::acquire()
    {
        std::unique_lock lock(mutex_);
        available_.wait(lock, [this]
                        { return !idle_.empty() || opened_ < max_size_; });
        if (!idle_.empty())
        {
            auto *handle = idle_.back();
            idle_.pop_back();
            return PooledConnection(*this, handle);
        }
        ++opened_;
        lock.unlock();
        sqlite3 *handle = nullptr;
        try
        {
            handle = open_connection();
        }
        catch (...)
        {
            std::lock_guard relock(mutex_);
            --opened_;
            available_.notify_one();
            throw;
        }
        return PooledConnection(*this, handle);
    }

    sqlite3 *ConnectionPool::open_connection()
    {
        sqlite3 *handle = nullptr;
        const auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
        const auto rc = sqlite3_open_v2(database_path_.string().c_str(), &handle, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = handle != nullptr ? sqlite3_errmsg(handle) : "out of memory";
            sqlite3_close(handle);
            throw sqlite::SqliteError(rc, "failed to open " + database_path_.string() + ": " + message);
        }
        try
        {
            sqlite3_busy_timeout(handle, 5000);
            sqlite::execute(handle, "PRAGMA journal_mode=WAL;");
            sqlite::execute(handle, "PRAGMA synchronous=NORMAL;");
        }
        catch (...)
        {
            sqlite3_close(handle);
            throw;
        }
        return handle;
    }

    void ConnectionPool::release(sqlite3 *handle) noexcept
    {
        {
            std::lock_guard lock(mutex_);
            idle_.push_back(handle);
        }
        available_.notify_one();
    }

} // namespace stowage::server
