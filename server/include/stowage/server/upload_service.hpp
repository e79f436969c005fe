#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "stowage/protocol.hpp"
#include "stowage/server/change_feed.hpp"
#include "stowage/server/chunk_writer.hpp"
#include "stowage/server/claim_coordinator.hpp"
#include "stowage/server/errors.hpp"
#include "stowage/server/record_store.hpp"

namespace stowage::server
{

    // Upload lifecycle operations behind the HTTP routes: ties the record
    // store to the backing files under storage_root.
    class UploadService
    {
    public:
        UploadService(RecordStore &store, ClaimCoordinator &claims, std::filesystem::path storage_root);

        // Creates the backing file, then the record. If the record cannot be
        // written the file is deleted again; this is a compensation, not an
        // atomic commit.
        protocol::UploadRecord initialize(const protocol::UploadInitRequest &request);

        protocol::UploadRecord get(const std::string &id);

        // Validates the record and returns a writer positioned at offset.
        RangeWriter begin_chunk(const std::string &id, std::uint64_t offset);

        void write_chunk(const std::string &id, std::uint64_t offset, std::span<const std::byte> data);

        void finish(const std::string &id);

        void abandon(const std::string &id);

        // Abandons UPLOADING records idle for longer than max_age.
        std::size_t abandon_expired(std::chrono::seconds max_age);

        std::optional<protocol::UploadRecord> claim(const protocol::ClaimRequest &request);

        void update_status(const std::string &id, UploadStatus status);

        std::shared_ptr<StatusSubscription> watch(const std::string &id);

        const std::filesystem::path &storage_root() const noexcept { return storage_root_; }

    private:
        RecordStore &store_;
        ClaimCoordinator &claims_;
        std::filesystem::path storage_root_;
    };

} // namespace stowage::server
