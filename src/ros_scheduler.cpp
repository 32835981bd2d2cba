#include "RunSessionCore/ros_scheduler.hpp"
#include <utility>

RclcppScheduler::RclcppScheduler(rclcpp::Node* node)
    : node_(node),
      next_id_(1)
{
}

RclcppScheduler::~RclcppScheduler()
{
    for (auto& entry : timers_) {
        entry.second->cancel();
    }
    timers_.clear();
}

int64_t RclcppScheduler::now_ms() const
{
    return node_->get_clock()->now().nanoseconds() / 1000000;
}

TaskHandle RclcppScheduler::schedule_once(std::chrono::milliseconds delay, TaskCallback callback)
{
    auto token = std::make_shared<TaskToken>();
    uint64_t id = next_id_++;

    // The executor keeps the timer alive while its callback runs,
    // so retiring it from inside the callback is safe
    auto timer = node_->create_wall_timer(delay, [this, id, token, callback]() {
        if (token->cancelled || token->finished) return;
        token->finished = true;
        TaskCallback run = callback;
        this->retire(id);
        run();
    });

    timers_[id] = timer;
    token->release = [this, id]() { this->retire(id); };
    return TaskHandle(token);
}

TaskHandle RclcppScheduler::schedule_periodic(std::chrono::milliseconds period, TaskCallback callback)
{
    auto token = std::make_shared<TaskToken>();
    uint64_t id = next_id_++;

    auto timer = node_->create_wall_timer(period, [token, callback]() {
        if (token->cancelled) return;
        callback();
    });

    timers_[id] = timer;
    token->release = [this, id]() { this->retire(id); };
    return TaskHandle(token);
}

void RclcppScheduler::retire(uint64_t id)
{
    auto it = timers_.find(id);
    if (it == timers_.end()) return;

    it->second->cancel();
    timers_.erase(it);
}
