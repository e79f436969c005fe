#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "stowage/protocol.hpp"
#include "stowage/server/connection_pool.hpp"
#include "stowage/server/errors.hpp"

namespace stowage::server
{

    // Hands pending uploads to workers. A claim is a single conditional update
    // limited to one row, so two workers can never receive the same record.
    //
    // Claims are not leases: nothing renews them. A record claimed with
    // want_processing=true is only eligible once its last_activity is older
    // than kReclaimGrace, which recovers records from crashed workers but can
    // also take one away from a worker that is merely slow.
    class ClaimCoordinator
    {
    public:
        static constexpr std::chrono::seconds kReclaimGrace{60};

        explicit ClaimCoordinator(ConnectionPool &pool);

        std::optional<protocol::UploadRecord> claim(const std::string &project, const std::string &pipeline,
                                                    UploadStatus status, bool want_processing);

    private:
        ConnectionPool &pool_;
    };

} // namespace stowage::server
