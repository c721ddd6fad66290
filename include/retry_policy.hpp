#pragma once

#include <chrono>
#include <optional>

/**
 * Decides whether and when the resume loop starts another cycle after a
 * transient failure.
 */
class RetryPolicy
{
public:
    virtual ~RetryPolicy() = default;

    /**
     * @param retryNumber 1 for the first retry, 2 for the second, ...
     * @return Delay to wait before that retry, or nullopt to give up
     */
    virtual std::optional<std::chrono::milliseconds> nextDelay(int retryNumber) const = 0;
};

/**
 * Same delay before every retry. Unlimited unless maxRetries is positive.
 */
class FixedDelayRetryPolicy final : public RetryPolicy
{
public:
    static constexpr std::chrono::milliseconds DEFAULT_DELAY{1000};

    explicit FixedDelayRetryPolicy(std::chrono::milliseconds delay = DEFAULT_DELAY, int maxRetries = 0);

    std::optional<std::chrono::milliseconds> nextDelay(int retryNumber) const override;

    bool isUnlimited() const { return maxRetries_ <= 0; }

private:
    std::chrono::milliseconds delay_;
    int maxRetries_;
};
