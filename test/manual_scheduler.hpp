/*
 * Deterministic scheduler for unit tests.
 * Time only moves when advance() is called; due tasks run in deadline order.
 */

#ifndef TEST_MANUAL_SCHEDULER_HPP_
#define TEST_MANUAL_SCHEDULER_HPP_

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>
#include "RunSessionCore/scheduler.hpp"

class ManualScheduler : public Scheduler
{
public:
    explicit ManualScheduler(int64_t start_ms = 1000000) : now_(start_ms), next_id_(1) {}

    int64_t now_ms() const override { return now_; }

    TaskHandle schedule_once(std::chrono::milliseconds delay, TaskCallback callback) override
    {
        return add(delay.count(), 0, std::move(callback));
    }

    TaskHandle schedule_periodic(std::chrono::milliseconds period, TaskCallback callback) override
    {
        return add(period.count(), period.count(), std::move(callback));
    }

    // Move the clock forward, running every task that falls due on the way
    void advance(int64_t ms)
    {
        int64_t target = now_ + ms;

        while (true) {
            prune();
            auto next = std::min_element(tasks_.begin(), tasks_.end(),
                [](const Task& a, const Task& b) {
                    return a.due < b.due || (a.due == b.due && a.id < b.id);
                });
            if (next == tasks_.end() || next->due > target) break;

            now_ = next->due;
            TaskCallback callback = next->callback;
            std::shared_ptr<TaskToken> token = next->token;

            if (next->period == 0) {
                token->finished = true;
                tasks_.erase(next);
            } else {
                next->due += next->period;
            }
            callback();
        }

        now_ = target;
    }

    size_t pending_count()
    {
        prune();
        return tasks_.size();
    }

private:
    struct Task
    {
        uint64_t id;
        int64_t due;
        int64_t period;     // 0 for one-shot
        TaskCallback callback;
        std::shared_ptr<TaskToken> token;
    };

    TaskHandle add(int64_t delay, int64_t period, TaskCallback callback)
    {
        auto token = std::make_shared<TaskToken>();
        tasks_.push_back(Task{next_id_++, now_ + std::max<int64_t>(delay, 0), period,
                              std::move(callback), token});
        return TaskHandle(token);
    }

    void prune()
    {
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
            [](const Task& task) { return task.token->cancelled; }), tasks_.end());
    }

    int64_t now_;
    uint64_t next_id_;
    std::vector<Task> tasks_;
};

#endif // TEST_MANUAL_SCHEDULER_HPP_
