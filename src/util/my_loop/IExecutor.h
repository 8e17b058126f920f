#pragma once

#include <chrono>
#include <functional>

namespace my_loop {

/**
 * @brief 单线程任务调度接口
 *
 * 所有投递的任务在同一个线程中串行执行，任务之间不会并发。
 * 业务层依赖该接口，便于替换实现（EventLoop / 测试用的手动时钟）
 */
class IExecutor {
public:
    using Task = std::function<void()>;

    virtual ~IExecutor() = default;

    // 尽快执行（按投递顺序）
    virtual void Post(Task task) = 0;

    // 延迟 delay 后执行；相同到期时间按投递顺序执行
    virtual void PostDelayed(std::chrono::milliseconds delay, Task task) = 0;
};

} // namespace my_loop
