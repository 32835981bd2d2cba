#ifndef RUN_SESSION_SCHEDULER_HPP_
#define RUN_SESSION_SCHEDULER_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

using TaskCallback = std::function<void()>;

/**
 * Shared state between a scheduled task and its handle.
 * The scheduler checks it before every invocation.
 */
struct TaskToken
{
    bool cancelled = false;
    bool finished = false;           // One-shot task has run
    std::function<void()> release;   // Frees the backing timer, if any
};

/**
 * Cancellation handle for a scheduled task.
 * Copies share the same token; cancel() is idempotent.
 */
class TaskHandle
{
public:
    TaskHandle() = default;
    explicit TaskHandle(std::shared_ptr<TaskToken> token);

    void cancel();
    bool is_pending() const;

private:
    std::shared_ptr<TaskToken> token_;
};

/**
 * Timer source for all deferred work in the session core.
 * Every delayed or periodic action goes through here so that stop()
 * can cancel it deterministically.
 */
class Scheduler
{
public:
    virtual ~Scheduler() = default;

    // Current time in milliseconds on the scheduler's clock
    virtual int64_t now_ms() const = 0;

    // Run callback once after delay
    virtual TaskHandle schedule_once(std::chrono::milliseconds delay, TaskCallback callback) = 0;

    // Run callback every period until cancelled
    virtual TaskHandle schedule_periodic(std::chrono::milliseconds period, TaskCallback callback) = 0;
};

#endif // RUN_SESSION_SCHEDULER_HPP_
