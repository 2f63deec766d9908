#ifndef GTO_BROKER_SOLVER_WORKER_SLOT_POOL_H_
#define GTO_BROKER_SOLVER_WORKER_SLOT_POOL_H_

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace gto_broker {
namespace solver {

// Bounds the number of solver processes running at once. Waiters are
// admitted strictly in arrival order.
class WorkerSlotPool {
 public:
  // Held for the duration of one solver run.
  class Slot {
   public:
    ~Slot();
    Slot(Slot&& other) noexcept;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    friend class WorkerSlotPool;
    explicit Slot(WorkerSlotPool* pool) : pool_(pool) {}

    WorkerSlotPool* pool_;
  };

  // Throws std::invalid_argument if size < 1.
  explicit WorkerSlotPool(int size);

  // Blocks until a slot is free and every earlier caller has been served.
  Slot Acquire();

  int Size() const { return size_; }
  int InUse() const;
  int Waiting() const;

 private:
  void Release();

  const int size_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int in_use_ = 0;
  uint64_t next_ticket_ = 0;
  uint64_t next_to_admit_ = 0;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_WORKER_SLOT_POOL_H_
