#include "stowage/server/change_feed.hpp"

#include <algorithm>
#include <iterator>

namespace stowage::server
{

    StatusSubscription::StatusSubscription(std::string upload_id)
        : upload_id_(std::move(upload_id)) {}

    std::optional<UploadStatus> StatusSubscription::next()
    {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]
                    { return !queue_.empty() || closed_; });
        if (queue_.empty())
        {
            return std::nullopt;
        }
        const auto status = queue_.front();
        queue_.pop_front();
        return status;
    }

    std::optional<UploadStatus> StatusSubscription::try_next()
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        const auto status = queue_.front();
        queue_.pop_front();
        return status;
    }

    void StatusSubscription::async_next(Handler handler)
    {
        std::optional<UploadStatus> ready;
        bool deliver_now = false;
        {
            std::lock_guard lock(mutex_);
            if (!queue_.empty())
            {
                ready = queue_.front();
                queue_.pop_front();
                deliver_now = true;
            }
            else if (closed_)
            {
                deliver_now = true;
            }
            else
            {
                pending_ = std::move(handler);
            }
        }
        if (deliver_now)
        {
            handler(ready);
        }
    }

    void StatusSubscription::close()
    {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return;
            }
            closed_ = true;
            handler = std::move(pending_);
            pending_ = nullptr;
        }
        ready_.notify_all();
        if (handler)
        {
            handler(std::nullopt);
        }
    }

    bool StatusSubscription::closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    void StatusSubscription::push(UploadStatus status)
    {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            if (closed_ || last_pushed_ == status)
            {
                return;
            }
            last_pushed_ = status;
            if (pending_)
            {
                handler = std::move(pending_);
                pending_ = nullptr;
            }
            else
            {
                queue_.push_back(status);
            }
        }
        if (handler)
        {
            handler(status);
            return;
        }
        ready_.notify_one();
    }

    std::shared_ptr<StatusSubscription> ChangeFeed::subscribe(const std::string &upload_id, UploadStatus current)
    {
        auto subscription = std::make_shared<StatusSubscription>(upload_id);
        subscription->push(current);
        std::lock_guard lock(mutex_);
        prune_locked();
        subscribers_[upload_id].push_back(subscription);
        return subscription;
    }

    void ChangeFeed::prune_locked()
    {
        for (auto it = subscribers_.begin(); it != subscribers_.end();)
        {
            auto &entries = it->second;
            entries.erase(std::remove_if(entries.begin(), entries.end(), [](const auto &weak)
                                         {
                auto subscription = weak.lock();
                return !subscription || subscription->closed(); }),
                          entries.end());
            it = entries.empty() ? subscribers_.erase(it) : std::next(it);
        }
    }

    void ChangeFeed::publish(const std::string &upload_id, UploadStatus status)
    {
        std::vector<std::shared_ptr<StatusSubscription>> targets;
        {
            std::lock_guard lock(mutex_);
            auto it = subscribers_.find(upload_id);
            if (it == subscribers_.end())
            {
                return;
            }
            auto &entries = it->second;
            entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const auto &weak)
                                         {
                auto subscription = weak.lock();
                if (!subscription || subscription->closed())
                {
                    return true;
                }
                targets.push_back(std::move(subscription));
                return false; }),
                          entries.end());
            if (entries.empty())
            {
                subscribers_.erase(it);
            }
        }
        for (const auto &subscription : targets)
        {
            subscription->push(status);
        }
    }

    void ChangeFeed::close_all()
    {
        std::vector<std::shared_ptr<StatusSubscription>> targets;
        {
            std::lock_guard lock(mutex_);
            for (auto &[id, entries] : subscribers_)
            {
                for (auto &weak : entries)
                {
                    if (auto subscription = weak.lock())
                    {
                        targets.push_back(std::move(subscription));
                    }
                }
            }
            subscribers_.clear();
        }
        for (const auto &subscription : targets)
        {
            subscription->close();
        }
    }

    std::size_t ChangeFeed::watched_uploads()
    {
        std::lock_guard lock(mutex_);
        return subscribers_.size();
    }

    std::size_t ChangeFeed::subscriber_count(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        auto it = subscribers_.find(upload_id);
        if (it == subscribers_.end())
        {
            return 0;
        }
        return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(), [](const auto &weak)
                                                      {
            auto subscription = weak.lock();
            return subscription && !subscription->closed(); }));
    }

} // namespace stowage::server
