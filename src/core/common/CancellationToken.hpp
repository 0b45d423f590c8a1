#pragma once

#include <QtCore/QDeadlineTimer>
#include <atomic>
#include <memory>

namespace Scribe {

// Shared flag raised once to stop a session; copies observe the same flag.
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Bounds one unit of work: expiry and cancellation both stop it.
struct WorkLimit {
    QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever);
    CancellationToken cancellation;

    bool expired() const { return deadline.hasExpired(); }
    bool cancelled() const { return cancellation.isCancelled(); }
    bool stopRequested() const { return expired() || cancelled(); }
};

} // namespace Scribe
