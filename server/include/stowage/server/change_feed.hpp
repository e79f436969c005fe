#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stowage/status.hpp"

namespace stowage::server
{

    class ChangeFeed;

    // Lazy, potentially infinite sequence of status values for one upload.
    // The first value is the status at subscription time; later values are
    // delivered in commit order with consecutive duplicates dropped. An empty
    // result from next() means the subscription was closed, which is distinct
    // from having received a terminal status.
    class StatusSubscription
    {
    public:
        using Handler = std::function<void(std::optional<UploadStatus>)>;

        explicit StatusSubscription(std::string upload_id);

        const std::string &upload_id() const noexcept { return upload_id_; }

        std::optional<UploadStatus> next();
        std::optional<UploadStatus> try_next();

        // Invokes handler exactly once, on the calling thread when a value is
        // already queued and on the publishing thread otherwise. Only one
        // handler may be pending at a time.
        void async_next(Handler handler);

        void close();
        bool closed() const;

    private:
        friend class ChangeFeed;

        void push(UploadStatus status);

        std::string upload_id_;
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<UploadStatus> queue_;
        std::optional<UploadStatus> last_pushed_;
        Handler pending_;
        bool closed_{false};
    };

    class ChangeFeed
    {
    public:
        std::shared_ptr<StatusSubscription> subscribe(const std::string &upload_id, UploadStatus current);

        void publish(const std::string &upload_id, UploadStatus status);

        void close_all();

        std::size_t subscriber_count(const std::string &upload_id);

        // Number of uploads with at least one tracked subscription.
        std::size_t watched_uploads();

    private:
        void prune_locked();

        std::mutex mutex_;
        std::map<std::string, std::vector<std::weak_ptr<StatusSubscription>>> subscribers_;
    };

} // namespace stowage::server
