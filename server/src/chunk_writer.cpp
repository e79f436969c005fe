#include "stowage/server/chunk_writer.hpp"

#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace stowage::server
{

    namespace
    {

        std::string errno_message(const std::string &what, int error)
        {
            return what + ": " + std::strerror(error);
        }

        FileLock open_locked(const std::filesystem::path &path, int open_flags, bool exclusive)
        {
            const int fd = ::open(path.c_str(), open_flags | O_CLOEXEC);
            if (fd < 0)
            {
                const int error = errno;
                if (error == ENOENT)
                {
                    throw ChunkWriterError(ErrorCode::NotFound, "Backing file " + path.string() + " does not exist");
                }
                throw ChunkWriterError(ErrorCode::IoError, errno_message("open " + path.string(), error));
            }
            FileLock lock(fd, exclusive);
            int rc = 0;
            do
            {
                rc = ::flock(fd, (exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB);
            } while (rc != 0 && errno == EINTR);
            if (rc != 0)
            {
                const int error = errno;
                if (error == EWOULDBLOCK)
                {
                    throw ChunkWriterError(ErrorCode::Locked, "file is locked");
                }
                throw ChunkWriterError(ErrorCode::IoError, errno_message("flock " + path.string(), error));
            }
            return lock;
        }

    } // namespace

    FileLock::FileLock(int fd, bool exclusive) noexcept
        : fd_(fd), exclusive_(exclusive) {}

    FileLock::~FileLock()
    {
        reset();
    }

    FileLock::FileLock(FileLock &&other) noexcept
        : fd_(std::exchange(other.fd_, -1)), exclusive_(other.exclusive_) {}

    FileLock &FileLock::operator=(FileLock &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
            exclusive_ = other.exclusive_;
        }
        return *this;
    }

    void FileLock::reset() noexcept
    {
        if (fd_ >= 0)
        {
            // Closing the last descriptor releases the flock.
            ::close(fd_);
            fd_ = -1;
        }
    }

    RangeWriter::RangeWriter(FileLock lock, std::uint64_t total_size, std::uint64_t offset) noexcept
        : lock_(std::move(lock)), total_size_(total_size), offset_(offset) {}

    void RangeWriter::write(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        if (offset_ > total_size_ || data.size() > total_size_ - offset_)
        {
            throw ChunkWriterError(ErrorCode::ExceededBounds, "Exceeded file bounds");
        }

        std::size_t written = 0;
        while (written < data.size())
        {
            const auto rc = ::pwrite(lock_.fd(), data.data() + written, data.size() - written,
                                     static_cast<off_t>(offset_ + written));
            if (rc < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw ChunkWriterError(ErrorCode::IoError, errno_message("pwrite", errno));
            }
            written += static_cast<std::size_t>(rc);
        }
        if (::fsync(lock_.fd()) != 0)
        {
            throw ChunkWriterError(ErrorCode::IoError, errno_message("fsync", errno));
        }

        offset_ += written;
        bytes_written_ += written;
    }

    namespace chunk_writer
    {

        std::filesystem::path file_path(const std::filesystem::path &location, const std::string &id)
        {
            if (id.empty() || id.front() == '.' || id.find('/') != std::string::npos)
            {
                throw ChunkWriterError(ErrorCode::InvalidPayload, "Invalid upload id");
            }
            return location / id;
        }

        void create(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size)
        {
            if (total_size > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()))
            {
                throw ChunkWriterError(ErrorCode::TooLarge, "File too large");
            }
            const auto path = file_path(location, id);
            std::error_code ec;
            std::filesystem::create_directories(location, ec);
            if (ec)
            {
                throw ChunkWriterError(ErrorCode::IoError, "create " + location.string() + ": " + ec.message());
            }

            const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
            if (fd < 0)
            {
                const int error = errno;
                if (error == EEXIST)
                {
                    throw ChunkWriterError(ErrorCode::AlreadyExists, "Backing file " + path.string() + " already exists");
                }
                throw ChunkWriterError(ErrorCode::IoError, errno_message("create " + path.string(), error));
            }

            int reserve_error = 0;
            if (total_size > 0)
            {
                // posix_fallocate reports through its return value, not errno.
                reserve_error = ::posix_fallocate(fd, 0, static_cast<off_t>(total_size));
            }
            ::close(fd);

            if (reserve_error != 0)
            {
                std::filesystem::remove(path, ec);
                if (ec)
                {
                    spdlog::error("Failed to remove {} after reservation failure: {}", path.string(), ec.message());
                }
                throw ChunkWriterError(ErrorCode::IoError,
                                       errno_message("reserve " + std::to_string(total_size) + " bytes", reserve_error));
            }
        }

        RangeWriter open_range(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size,
                               std::uint64_t offset)
        {
            if (offset > total_size)
            {
                throw ChunkWriterError(ErrorCode::OffsetTooLarge, "Offset too large");
            }
            auto lock = open_locked(file_path(location, id), O_WRONLY, false);
            return RangeWriter(std::move(lock), total_size, offset);
        }

        void write_range(const std::filesystem::path &location, const std::string &id, std::uint64_t total_size,
                         std::uint64_t offset, std::span<const std::byte> data)
        {
            auto writer = open_range(location, id, total_size, offset);
            writer.write(data);
        }

        FileLock exclusive_lock(const std::filesystem::path &location, const std::string &id)
        {
            return open_locked(file_path(location, id), O_RDONLY, true);
        }

        void remove(const std::filesystem::path &location, const std::string &id)
        {
            const auto path = file_path(location, id);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                throw ChunkWriterError(ErrorCode::IoError, "remove " + path.string() + ": " + ec.message());
            }
        }

    } // namespace chunk_writer

} // namespace stowage::server
