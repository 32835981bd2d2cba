#ifndef RUN_SESSION_ROS_SCHEDULER_HPP_
#define RUN_SESSION_ROS_SCHEDULER_HPP_

#include <cstdint>
#include <unordered_map>
#include "RunSessionCore/scheduler.hpp"
#include "rclcpp/rclcpp.hpp"

/**
 * Scheduler backed by rclcpp wall timers on the owning node.
 * Callbacks run on the node's executor thread, so the session core
 * never sees concurrent invocations.
 */
class RclcppScheduler : public Scheduler
{
public:
    /**
     * @param node Node that owns the timers; must outlive the scheduler
     */
    explicit RclcppScheduler(rclcpp::Node* node);
    ~RclcppScheduler() override;

    int64_t now_ms() const override;
    TaskHandle schedule_once(std::chrono::milliseconds delay, TaskCallback callback) override;
    TaskHandle schedule_periodic(std::chrono::milliseconds period, TaskCallback callback) override;

private:
    // Cancel and drop the timer registered under id
    void retire(uint64_t id);

    rclcpp::Node* node_;
    std::unordered_map<uint64_t, rclcpp::TimerBase::SharedPtr> timers_;
    uint64_t next_id_;
};

#endif // RUN_SESSION_ROS_SCHEDULER_HPP_
