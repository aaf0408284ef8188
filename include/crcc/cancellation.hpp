#pragma once

#include <QAtomicInt>
#include <QSharedPointer>

namespace crcc {

// Shared flag threaded through every blocking engine call and subprocess wait.
// Copies observe the same flag; a default-constructed token can still be cancelled.
class CancellationToken {
public:
    CancellationToken()
        : flag_(QSharedPointer<QAtomicInt>::create(0)) {}

    void cancel() const { flag_->storeRelease(1); }
    [[nodiscard]] bool isCancelled() const { return flag_->loadAcquire() != 0; }

private:
    QSharedPointer<QAtomicInt> flag_;
};

}  // namespace crcc
