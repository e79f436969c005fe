#pragma once

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>
#include <utility>

#include "stowage/client/http_client.hpp"
#include "stowage/client/logger.hpp"

namespace stowage::client
{

    // Exponential backoff: the pause after failed attempt n is base_delay * 2^n,
    // clamped to max_delay.
    struct RetryPolicy
    {
        std::size_t attempts{7};
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds max_delay{std::chrono::minutes{5}};

        std::chrono::milliseconds delay_for(std::size_t attempt) const noexcept;
    };

    // Returns false when stop was requested before the delay elapsed.
    bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop);

    [[noreturn]] void throw_cancelled(const std::string &what);

    // Runs fn until it succeeds, a permanent TransferError escapes, or the
    // attempts run out. Exhaustion is reported as a single Exhausted error.
    template <typename Fn>
    auto with_retry(const RetryPolicy &policy, std::stop_token stop, Logger &logger, const std::string &what, Fn &&fn)
        -> decltype(fn())
    {
        std::string last_error = "no attempt made";
        for (std::size_t attempt = 0; attempt < policy.attempts; ++attempt)
        {
            if (stop.stop_requested())
            {
                throw_cancelled(what);
            }
            try
            {
                return fn();
            }
            catch (const TransferError &ex)
            {
                if (!ex.retryable())
                {
                    logger.log("error", what, " failed permanently: ", ex.what());
                    throw;
                }
                last_error = ex.what();
            }

            if (attempt + 1 == policy.attempts)
            {
                break;
            }
            const auto delay = policy.delay_for(attempt);
            logger.log("retry", what, " attempt ", attempt + 1, " failed, sleeping ", delay.count(), "ms: ",
                       last_error);
            if (!interruptible_sleep(delay, stop))
            {
                throw_cancelled(what);
            }
        }
        logger.log("error", what, " gave up after ", policy.attempts, " attempts");
        throw TransferError(TransferErrorKind::Exhausted,
                            what + " failed after " + std::to_string(policy.attempts) + " attempts: " + last_error);
    }

} // namespace stowage::client
