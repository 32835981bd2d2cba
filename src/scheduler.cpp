#include "RunSessionCore/scheduler.hpp"
#include <utility>

TaskHandle::TaskHandle(std::shared_ptr<TaskToken> token)
    : token_(std::move(token))
{
}

void TaskHandle::cancel()
{
    if (!token_ || token_->cancelled) return;

    token_->cancelled = true;
    if (token_->release) {
        auto release = std::move(token_->release);
        token_->release = nullptr;
        release();
    }
}

bool TaskHandle::is_pending() const
{
    return token_ && !token_->cancelled && !token_->finished;
}
