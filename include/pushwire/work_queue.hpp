/**
 * @file work_queue.hpp
 * @brief Bounded job queue drained by one worker thread.
 *
 * @details
 * Fetches, delivery receipts and emergency acknowledgments block on HTTP. The
 * session thread must keep reading frames meanwhile, so it hands those calls
 * to an IExecutor and returns at once.
 *
 * WorkQueue is the production executor: a fixed-capacity FIFO (`etl::deque`)
 * and one thread. Jobs run in post order, one at a time. `post()` refuses a
 * job when the queue is full instead of growing; the caller logs and retries
 * on its own schedule.
 *
 * Tests use an executor that runs jobs inline.
 */
#ifndef PUSHWIRE_WORK_QUEUE_HPP
#define PUSHWIRE_WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include <etl/deque.h>

namespace pushwire {

using Job = std::function<void()>;

class IExecutor {
public:
  virtual ~IExecutor() = default;
  /// Queue @p job. Returns false when it was not accepted.
  virtual bool post(Job job) = 0;
};

class WorkQueue : public IExecutor {
public:
  static constexpr size_t CAPACITY = 64;

  WorkQueue() = default;
  ~WorkQueue();

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  void start();

  /// Finish the job in progress, drop the rest, join the thread.
  void stop();

  bool post(Job job) override;

  size_t pending() const;

private:
  void run();

  mutable std::mutex            mu_;
  std::condition_variable       cv_;
  etl::deque<Job, CAPACITY>     jobs_;
  bool                          stopping_{false};
  std::thread                   worker_;
};

} // namespace pushwire

#endif // PUSHWIRE_WORK_QUEUE_HPP
