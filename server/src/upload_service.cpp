#include "stowage/server/upload_service.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "stowage/crypto.hpp"

namespace stowage::server
{

    namespace
    {

        constexpr std::size_t kHashLength = 64;

        bool is_hex_digest(const std::string &value)
        {
            return value.size() == kHashLength && std::all_of(value.begin(), value.end(), [](char ch)
                                                              { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
        }

        void require_uploading(const protocol::UploadRecord &record)
        {
            if (record.status != UploadStatus::Uploading)
            {
                throw UploadError(ErrorCode::WrongStatus, "Item is not in the UPLOADING status");
            }
        }

    } // namespace

    UploadService::UploadService(RecordStore &store, ClaimCoordinator &claims, std::filesystem::path storage_root)
        : store_(store), claims_(claims), storage_root_(std::move(storage_root)) {}

    protocol::UploadRecord UploadService::initialize(const protocol::UploadInitRequest &request)
    {
        if (request.file.name.empty())
        {
            throw UploadError(ErrorCode::InvalidPayload, "File name must not be empty");
        }
        if (!is_hex_digest(request.file.hash))
        {
            throw UploadError(ErrorCode::InvalidPayload, "File hash must be a hex-encoded SHA-256 digest");
        }

        const auto id = crypto::generate_upload_id();
        chunk_writer::create(storage_root_, id, request.file.size);

        try
        {
            auto record = store_.create(id, request.file, request.project, request.pipeline, request.metadata,
                                        storage_root_.string());
            spdlog::info("Created upload {} for {} ({} bytes, {}/{})", id, request.file.name, request.file.size,
                         request.project, request.pipeline);
            return record;
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Record creation for {} failed, removing backing file: {}", id, ex.what());
            try
            {
                chunk_writer::remove(storage_root_, id);
            }
            catch (const ChunkWriterError &cleanup)
            {
                spdlog::error("Orphaned backing file for {}: {}", id, cleanup.what());
            }
            throw;
        }
    }

    protocol::UploadRecord UploadService::get(const std::string &id)
    {
        return store_.get(id);
    }

    RangeWriter UploadService::begin_chunk(const std::string &id, std::uint64_t offset)
    {
        const auto record = store_.get(id);
        require_uploading(record);
        if (offset > record.file.size)
        {
            throw UploadError(ErrorCode::OffsetTooLarge, "Offset too large");
        }
        store_.touch(id);
        auto writer = chunk_writer::open_range(record.storage_location, id, record.file.size, offset);

        // A finish may have completed between the check above and taking the
        // shared lock; once the lock is held the status can no longer change.
        require_uploading(store_.get(id));
        return writer;
    }

    void UploadService::write_chunk(const std::string &id, std::uint64_t offset, std::span<const std::byte> data)
    {
        auto writer = begin_chunk(id, offset);
        writer.write(data);
        spdlog::debug("Wrote {} bytes to {} at offset {}", data.size(), id, offset);
    }

    void UploadService::finish(const std::string &id)
    {
        const auto record = store_.get(id);
        require_uploading(record);
        FileLock lock = [&]
        {
            try
            {
                return chunk_writer::exclusive_lock(record.storage_location, id);
            }
            catch (const ChunkWriterError &ex)
            {
                if (ex.code() == ErrorCode::Locked)
                {
                    throw UploadError(ErrorCode::Locked, "Lock failed: a chunk write is still in progress");
                }
                throw;
            }
        }();
        store_.transition(id, UploadStatus::Uploading, UploadStatus::Verifying);
    }

    void UploadService::abandon(const std::string &id)
    {
        const auto record = store_.get(id);
        require_uploading(record);
        {
            auto lock = chunk_writer::exclusive_lock(record.storage_location, id);
            store_.transition(id, UploadStatus::Uploading, UploadStatus::Abandoned);
        }
        try
        {
            chunk_writer::remove(record.storage_location, id);
        }
        catch (const ChunkWriterError &ex)
        {
            spdlog::error("Upload {} abandoned but its file could not be removed: {}", id, ex.what());
        }
    }

    std::size_t UploadService::abandon_expired(std::chrono::seconds max_age)
    {
        const auto age = static_cast<std::uint64_t>(max_age.count());
        const auto now = RecordStore::now();
        const auto cutoff = now > age ? now - age : 0;

        std::size_t abandoned = 0;
        for (const auto &id : store_.find_idle(UploadStatus::Uploading, cutoff))
        {
            try
            {
                abandon(id);
                ++abandoned;
            }
            catch (const UploadError &ex)
            {
                spdlog::debug("Skipping expiry of {}: {}", id, ex.what());
            }
        }
        if (abandoned > 0)
        {
            spdlog::info("Abandoned {} idle uploads", abandoned);
        }
        return abandoned;
    }

    std::optional<protocol::UploadRecord> UploadService::claim(const protocol::ClaimRequest &request)
    {
        return claims_.claim(request.project, request.pipeline, request.status, request.processing);
    }

    void UploadService::update_status(const std::string &id, UploadStatus status)
    {
        store_.set_status_and_release(id, status);
    }

    std::shared_ptr<StatusSubscription> UploadService::watch(const std::string &id)
    {
        return store_.watch(id);
    }

} // namespace stowage::server
