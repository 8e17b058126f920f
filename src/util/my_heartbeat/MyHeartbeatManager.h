#pragma once
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ConnectionManager.hpp"
#include "DeliveryQueue.hpp"
#include "IExecutor.h"


namespace my_heartbeat {

/**
 * @brief 周期性发布心跳
 *
 * 心跳经 DeliveryQueue 发送：断线期间的心跳入队，重连后补发。
 * 所有方法在事件循环线程中调用。
 */
class HeartbeatManager {
public:
    HeartbeatManager(my_loop::IExecutor& executor,
                     my_pubsub::ConnectionManager& connection,
                     my_pubsub::DeliveryQueue& queue);

    ~HeartbeatManager();

    HeartbeatManager(const HeartbeatManager&) = delete;
    HeartbeatManager& operator=(const HeartbeatManager&) = delete;

    // cfg 示例：
    // {
    //   "interval_sec": 5,
    //   "topic_fmt": "system/heartbeats/{source}",
    //   "qos": 1, "retain": false,
    //   "source_id": "",          // 为空时使用主机名
    //   "base": {...}, "extra": {...}
    // }
    void Init(const nlohmann::json& config);
    void Start();
    void Stop();

    bool IsRunning() const { return running_; }

    /**
     * @brief Get the Heartbeat Snapshot object  / 获取最近一次心跳数据快照
     *
     * @return nlohmann::json
     */
    nlohmann::json GetHeartbeatSnapshot() const { return heartbeat_data_; }

    const std::string& Topic() const { return topic_; }

    std::uint64_t Sequence() const { return seq_; }

    // helper: format topic string by replacing {source}
    static std::string formatTopic(const std::string& fmt, const std::string& source);

private:
    /**
     * @brief 构建心跳数据
     *
     */
    void BuildHeartbeat();

    /**
     * @brief 发送心跳数据
     */
    void SendHeartbeat();

    void ScheduleNext();

private:
    my_loop::IExecutor&             executor_;
    my_pubsub::ConnectionManager&   connection_;
    my_pubsub::DeliveryQueue&       queue_;
    std::shared_ptr<char>           timer_token_;       // Stop 时重置，作废已排队的定时器
    bool running_{false};
    std::uint64_t seq_{0};
    nlohmann::json config_;             // 心跳配置
    nlohmann::json heartbeat_data_;     // 心跳数据
    int interval_sec_{5};               // 心跳间隔，默认5秒
    int qos_{1};
    bool retain_{false};
    time_t start_time_{0};              // 启动时间
    std::string source_id_;             // 用于替换 topic 中的 {source}
    std::string topic_;
};

} // namespace my_heartbeat
