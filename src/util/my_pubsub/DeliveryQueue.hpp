#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ConnectionManager.hpp"
#include "IExecutor.h"
#include "PubSubTypes.hpp"

namespace my_pubsub {

struct DeliveryConfig {
    // 重试上限：第 max_retries+1 次失败后丢弃
    int max_retries{5};

    // 线性退避基数：第 n 次重试前等待 retry_base_ms * n
    int retry_base_ms{1000};

    static DeliveryConfig FromJson(const nlohmann::json& j);
    nlohmann::json ToJson() const;
};

/**
 * @brief 待投递消息
 * 除 retry_count 外创建后不再修改；outcome 恰好触发一次
 */
struct PendingMessage {
    std::uint64_t id{0};
    std::string topic;
    std::string payload;
    PublishOptions options;
    int retry_count{0};
    DeliveryHandlers outcome;
    PubSubError last_error;
};

// 队列内消息的只读视图
struct PendingInfo {
    std::uint64_t id{0};
    std::string topic;
    int retry_count{0};
};

/**
 * @brief 保证每条 publish 最终成功或被明确告知失败
 *
 * @details
 * - 断线时 publish 直接入队并立即回调成功（"已接受"而非"已送达"）
 * - 已连接时直接发送；发送失败既入队重试，也立即把失败回调给调用方
 * - 每次连接成功（OnConnected）触发 Flush：取快照、清空队列、逐条独立发送
 * - 失败消息按线性退避重新入队，超过 max_retries 后丢弃并触发 on_failure
 *
 * 单线程模型：所有方法与回调都在事件循环线程中执行，队列本身不加锁。
 */
class DeliveryQueue : public IConnectionObserver {
public:
    DeliveryQueue(ConnectionManager& connection,
                  my_loop::IExecutor& executor,
                  DeliveryConfig config = DeliveryConfig{});
    ~DeliveryQueue() override;

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    /**
     * @brief 发布消息
     *
     * @param topic 主题，不能为空
     * @param payload 消息内容（任意字节）
     * @param options qos / retain
     * @param done 即时结果：入队或发送成功为 Ok；未初始化、参数错误、直接发送失败为错误
     * @param outcome 最终投递结果，恰好触发一次
     */
    void Publish(const std::string& topic,
                 const std::string& payload,
                 const PublishOptions& options,
                 PublishCallback done,
                 DeliveryHandlers outcome = DeliveryHandlers{});

    /**
     * @brief 订阅主题；未初始化或未连接时立即失败，不入队
     */
    void Subscribe(const std::vector<std::string>& topics,
                   const SubscribeOptions& options,
                   SubscribeCallback done);

    /**
     * @brief 尝试投递队列中的所有消息
     * 队列为空或连接未就绪时不做任何事
     */
    void Flush();

    std::size_t Size() const { return queue_.size(); }
    std::size_t InFlight() const { return in_flight_; }

    std::vector<PendingInfo> ListPending() const;

    const DeliveryConfig& GetConfig() const { return config_; }

    nlohmann::json GetStats() const;

    // IConnectionObserver
    void OnConnected() override;

private:
    using MessagePtr = std::shared_ptr<PendingMessage>;

    void Enqueue(MessagePtr msg);
    void Attempt(const MessagePtr& msg);
    void HandleAttemptFailed(const MessagePtr& msg, const PubSubError& error);
    void ScheduleRequeue(const MessagePtr& msg);

    void FireSuccess(const MessagePtr& msg);
    void FireFailure(const MessagePtr& msg, const PubSubError& error);

    static void Complete(const PublishCallback& done, const PubSubError& error);

private:
    ConnectionManager&          connection_;
    my_loop::IExecutor&         executor_;
    DeliveryConfig              config_;
    std::deque<MessagePtr>      queue_;                 // 等待投递的消息
    std::shared_ptr<char>       alive_;                 // 异步回调的有效性标记
    std::uint64_t               next_id_{1};
    std::size_t                 in_flight_{0};          // 已发出、等待 Transport 结果
    std::size_t                 backoff_pending_{0};    // 退避计时中
    std::uint64_t               delivered_{0};
    std::uint64_t               dropped_{0};
    std::uint64_t               retried_{0};
    std::uint64_t               flushes_{0};
};

} // namespace my_pubsub
