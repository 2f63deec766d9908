#include "solver/WorkerSlotPool.h"

#include <stdexcept>
#include <string>

namespace gto_broker {
namespace solver {

WorkerSlotPool::Slot::Slot(Slot&& other) noexcept : pool_(other.pool_) {
    other.pool_ = nullptr;
}

WorkerSlotPool::Slot::~Slot() {
    if (pool_ != nullptr) {
        pool_->Release();
    }
}

WorkerSlotPool::WorkerSlotPool(int size) : size_(size) {
    if (size < 1) {
        throw std::invalid_argument("Worker pool size must be at least 1, got " + std::to_string(size));
    }
}

WorkerSlotPool::Slot WorkerSlotPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [this, ticket] { return ticket == next_to_admit_ && in_use_ < size_; });
    ++next_to_admit_;
    ++in_use_;
    // The next ticket holder may be admissible too.
    cv_.notify_all();
    return Slot(this);
}

void WorkerSlotPool::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
    }
    cv_.notify_all();
}

int WorkerSlotPool::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

int WorkerSlotPool::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(next_ticket_ - next_to_admit_);
}

} // namespace solver
} // namespace gto_broker
