#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "IExecutor.h"

namespace my_loop {

/**
 * @brief 单线程事件循环（任务队列 + 定时器）
 *
 * @details
 * - 任意线程都可以 Post / PostDelayed（线程安全）
 * - 任务只在循环线程中执行：Run() 的调用线程，或 Start() 创建的工作线程
 * - Stop() 唤醒循环并退出；未执行的任务被丢弃
 */
class EventLoop : public IExecutor {
public:
    using Clock = std::chrono::steady_clock;

    explicit EventLoop(std::string name = "event_loop");
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Post(Task task) override;
    void PostDelayed(std::chrono::milliseconds delay, Task task) override;

    /**
     * @brief 在当前线程运行循环，直到 Stop()
     */
    void Run();

    /**
     * @brief 启动独立的循环线程
     * @return 已在运行时返回 false
     */
    bool Start();

    /**
     * @brief 停止循环并等待循环线程退出（非循环线程调用时）
     */
    void Stop();

    bool IsRunning() const { return running_.load(); }

    bool InLoopThread() const;

    // 待执行任务数 + 未到期定时器数
    std::size_t PendingCount() const;

    const std::string& Name() const { return name_; }

private:
    void RunTask(Task& task);

private:
    std::string name_;

    mutable std::mutex mu_;                     // 保护 ready_ / timers_ / stopping_
    std::condition_variable cv_;
    std::deque<Task> ready_;                    // 可立即执行的任务
    std::multimap<Clock::time_point, Task> timers_;   // 定时任务（按到期时间排序）
    bool stopping_{false};

    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> loop_thread_id_{};
    std::thread worker_;
};

} // namespace my_loop
