#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include "stowage/server/errors.hpp"

namespace stowage::server
{

    // An open backing file holding a flock(2) lock. Shared locks are held by
    // range writers; the exclusive lock proves that no writer is active.
    class FileLock
    {
    public:
        FileLock(int fd, bool exclusive) noexcept;
        ~FileLock();

        FileLock(FileLock &&other) noexcept;
        FileLock &operator=(FileLock &&other) noexcept;
        FileLock(const FileLock &) = delete;
        FileLock &operator=(const FileLock &) = delete;

        int fd() const noexcept { return fd_; }
        bool exclusive() const noexcept { return exclusive_; }

    private:
        void reset() noexcept;

        int fd_{-1};
        bool exclusive_{false};
    };

    // Writes consecutive pieces of one request body starting at a fixed offset.
    // Each piece is bounds-checked against the declared size before any of its
    // bytes are written and is fsynced before write() returns.
    class RangeWriter
    {
    public:
        RangeWriter(FileLock lock, std::uint64_t total_size, std::uint64_t offset) noexcept;

        void write(std::span<const std::byte> data);

        std::uint64_t offset() const noexcept { return offset_; }
        std::uint64_t bytes_written() const noexcept { return bytes_written_; }

    private:
        FileLock lock_;
        std::uint64_t total_size_;
        std::uint64_t offset_;
        std::uint64_t bytes_written_{0};
    };

    namespace chunk_writer
    {

        std::filesystem::path file_path(const std::filesystem::path &location, const std::string &id);

        // Creates the file exclusively and reserves total_size bytes for it.
        void create(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size);

        // Opens the file for writing at offset under a shared, non-blocking lock.
        RangeWriter open_range(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size,
                               std::uint64_t offset);

        void write_range(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size,
                         std::uint64_t offset, std::span<const std::byte> data);

        FileLock exclusive_lock(const std::filesystem::path &location, const std::string &id);

        void remove(const std::filesystem::path &location, const std::string &id);

    } // namespace chunk_writer

} // namespace stowage::server
