#include "retry_policy.hpp"
#include "test_support.hpp"

#include <chrono>

using std::chrono::milliseconds;

int main()
{
    TestReport report;

    FixedDelayRetryPolicy defaults;
    report.check(defaults.isUnlimited(), "default policy is unlimited");
    report.check(defaults.nextDelay(1) == milliseconds(1000), "default delay is one second");
    report.check(defaults.nextDelay(1000000) == milliseconds(1000), "default policy never gives up");

    FixedDelayRetryPolicy fast{milliseconds(25)};
    report.check(fast.nextDelay(7) == milliseconds(25), "custom delay is used for every retry");

    FixedDelayRetryPolicy capped{milliseconds(10), 3};
    report.check(!capped.isUnlimited(), "positive cap is limited");
    report.check(capped.nextDelay(1) && capped.nextDelay(3), "retries up to the cap are allowed");
    report.check(!capped.nextDelay(4), "retry past the cap is refused");

    FixedDelayRetryPolicy negative{milliseconds(-5)};
    report.check(negative.nextDelay(1) == milliseconds(0), "negative delay is clamped to zero");

    return report.finish();
}
