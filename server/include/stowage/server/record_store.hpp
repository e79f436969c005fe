#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "stowage/protocol.hpp"
#include "stowage/server/change_feed.hpp"
#include "stowage/server/connection_pool.hpp"
#include "stowage/server/errors.hpp"

namespace stowage::server
{

    // Persistent upload records. Coordination fields (status, processing) are
    // only ever changed through the conditional updates below; callers never
    // write back a whole record.
    class RecordStore
    {
    public:
        RecordStore(ConnectionPool &pool, ChangeFeed &feed);

        protocol::UploadRecord create(const std::string &id, const protocol::FileInfo &file, const std::string &project,
                                      const std::string &pipeline, const protocol::UploadMetadata &metadata,
                                      const std::string &storage_location);

        protocol::UploadRecord get(const std::string &id);

        void touch(const std::string &id);

        // Compare-and-set on status. Throws WrongStatus when the current status
        // is not `expected`, without writing anything.
        void transition(const std::string &id, UploadStatus expected, UploadStatus next);

        // Sets the status and clears the processing flag in one write. A record
        // in a terminal status is left as is and reported as WrongStatus.
        void set_status_and_release(const std::string &id, UploadStatus status);

        std::shared_ptr<StatusSubscription> watch(const std::string &id);

        std::vector<std::string> find_idle(UploadStatus status, std::uint64_t inactive_since);

        static std::uint64_t now();

    private:
        ConnectionPool &pool_;
        ChangeFeed &feed_;
        // Held across every status write and its publication so subscribers
        // see changes in commit order.
        std::mutex publish_mutex_;
    };

} // namespace stowage::server
