#pragma once

#include <QThread>

#include <algorithm>

namespace taskvault {
namespace core {

struct RetryPolicy
{
    int maxAttempts = 3;
    int initialDelayMs = 20;
    int maxDelayMs = 500;
};

// Runs operation until it returns true or the policy's attempts are used up.
// Sleeps between attempts with doubling delay; never blocks longer than the
// sum of the capped delays.
template <typename Operation>
bool retryWithBackoff(const RetryPolicy &policy, Operation &&operation)
{
    const int attempts = std::max(1, policy.maxAttempts);
    int delay = std::max(0, policy.initialDelayMs);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (operation()) {
            return true;
        }
        if (attempt < attempts && delay > 0) {
            QThread::msleep(static_cast<unsigned long>(delay));
            delay = std::min(delay * 2, policy.maxDelayMs);
        }
    }
    return false;
}

} // namespace core
} // namespace taskvault
