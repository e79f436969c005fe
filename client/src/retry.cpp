#include "stowage/client/retry.hpp"

#include <condition_variable>
#include <mutex>

namespace stowage::client
{

    std::chrono::milliseconds RetryPolicy::delay_for(std::size_t attempt) const noexcept
    {
        auto delay = base_delay;
        for (std::size_t i = 0; i < attempt && delay < max_delay; ++i)
        {
            delay *= 2;
        }
        return delay < max_delay ? delay : max_delay;
    }

    bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop)
    {
        std::mutex mutex;
        std::condition_variable_any wake;
        std::unique_lock lock(mutex);
        wake.wait_for(lock, stop, delay, []
                      { return false; });
        return !stop.stop_requested();
    }

    void throw_cancelled(const std::string &what)
    {
        throw TransferError(TransferErrorKind::Exhausted, what + " cancelled");
    }

} // namespace stowage::client
