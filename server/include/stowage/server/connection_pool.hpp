#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

struct sqlite3;

namespace stowage::server
{

    class ConnectionPool;

    // A connection checked out of the pool; returned on destruction.
    class PooledConnection
    {
    public:
        PooledConnection(ConnectionPool &pool, sqlite3 *handle) noexcept;
        ~PooledConnection();

        PooledConnection(const PooledConnection &) = delete;
        PooledConnection &operator=(const PooledConnection &) = delete;

        sqlite3 *get() const noexcept { return handle_; }

    private:
        ConnectionPool *pool_;
        sqlite3 *handle_;
    };

    // Bounded set of SQLite handles to the upload database. Connections are
    // opened on demand up to max_size; acquire() blocks while all of them are
    // checked out.
    class ConnectionPool
    {
    public:
        ConnectionPool(std::filesystem::path database_path, std::size_t max_size);
        ~ConnectionPool();

        ConnectionPool(const ConnectionPool &) = delete;
        ConnectionPool &operator=(const ConnectionPool &) = delete;

        PooledConnection acquire();

        std::size_t max_size() const noexcept { return max_size_; }

    private:
        friend class PooledConnection;

        sqlite3 *open_connection();
        void release(sqlite3 *handle) noexcept;

        std::filesystem::path database_path_;
        std::size_t max_size_;

        std::mutex mutex_;
        std::condition_variable available_;
        std::vector<sqlite3 *> idle_;
        std::size_t opened_{0};
    };

} // namespace stowage::server
