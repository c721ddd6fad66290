#include "retry_policy.hpp"

FixedDelayRetryPolicy::FixedDelayRetryPolicy(std::chrono::milliseconds delay, int maxRetries)
    : delay_(delay < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : delay),
      maxRetries_(maxRetries)
{
}

std::optional<std::chrono::milliseconds> FixedDelayRetryPolicy::nextDelay(int retryNumber) const
{
    if (!isUnlimited() && retryNumber > maxRetries_)
    {
        return std::nullopt;
    }
    return delay_;
}
