#include "EventLoop.h"

#include <exception>
#include <utility>

#include "MyLog.h"

namespace my_loop {

EventLoop::EventLoop(std::string name) : name_(std::move(name)) {}

EventLoop::~EventLoop() {
    Stop();
    if (worker_.joinable()) {
        worker_.detach();
    }
}

void EventLoop::Post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::PostDelayed(std::chrono::milliseconds delay, Task task) {
    if (!task) return;
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    {
        std::lock_guard<std::mutex> lk(mu_);
        timers_.emplace(Clock::now() + delay, std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::Run() {
    if (running_.exchange(true)) {
        MYLOG_WARN("EventLoop[{}] already running", name_);
        return;
    }
    loop_thread_id_.store(std::this_thread::get_id());
    MYLOG_INFO("EventLoop[{}] started", name_);

    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        // 到期定时器转入就绪队列（multimap 保证同一时刻按投递顺序）
        const auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first <= now) {
            ready_.push_back(std::move(timers_.begin()->second));
            timers_.erase(timers_.begin());
        }

        if (ready_.empty()) {
            if (timers_.empty()) {
                cv_.wait(lk, [this] { return stopping_ || !ready_.empty() || !timers_.empty(); });
            } else {
                cv_.wait_until(lk, timers_.begin()->first);
            }
            continue;
        }

        std::deque<Task> batch;
        batch.swap(ready_);
        lk.unlock();
        for (auto& task : batch) {
            RunTask(task);
        }
        lk.lock();
    }

    // 允许 Stop 之后再次 Run
    stopping_ = false;
    ready_.clear();
    timers_.clear();
    lk.unlock();

    loop_thread_id_.store(std::thread::id());
    running_.store(false);
    MYLOG_INFO("EventLoop[{}] stopped", name_);
}

bool EventLoop::Start() {
    if (running_.load() || worker_.joinable()) {
        MYLOG_WARN("EventLoop[{}] Start ignored: already running", name_);
        return false;
    }
    worker_ = std::thread(&EventLoop::Run, this);
    return true;
}

void EventLoop::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        if (std::this_thread::get_id() != worker_.get_id()) {
            worker_.join();
        } else {
            // 在循环线程内部 Stop：当前批次执行完后循环退出，由其他线程 join
            MYLOG_INFO("EventLoop[{}] Stop requested from loop thread", name_);
        }
    }
}

bool EventLoop::InLoopThread() const {
    return running_.load() && std::this_thread::get_id() == loop_thread_id_.load();
}

std::size_t EventLoop::PendingCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ready_.size() + timers_.size();
}

void EventLoop::RunTask(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        MYLOG_ERROR("EventLoop[{}] task exception: {}", name_, e.what());
    } catch (...) {
        MYLOG_ERROR("EventLoop[{}] task unknown exception", name_);
    }
}

} // namespace my_loop
