#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <mosquitto.h>

#include "ITransport.hpp"
#include "IExecutor.h"
#include "PublishTracker.hpp"

namespace my_pubsub {

/**
 * @brief 基于 libmosquitto 的 Transport 实现
 *
 * @details
 * - mosquitto 网络线程（loop_start）只负责把回调投递到事件循环，
 *   所有状态修改与上层回调都在事件循环线程中执行
 * - 断线后的重连由 mosquitto 自身完成（reconnect_delay_set）
 * - 识别的透传选项（ConnectionConfig::extra）：
 *   keepalive(秒) / will{topic,payload,qos,retain} / ca_file / ca_path / cert_file / key_file
 */
class MosqTransport : public ITransport {
public:
    explicit MosqTransport(my_loop::IExecutor& executor);
    ~MosqTransport() override;

    MosqTransport(const MosqTransport&) = delete;
    MosqTransport& operator=(const MosqTransport&) = delete;

    void SetListener(ITransportListener* listener) override;

    bool Connect(const BrokerAddress& address, const ConnectionConfig& config) override;

    void Publish(const std::string& topic,
                 const std::string& payload,
                 const PublishOptions& options,
                 PublishCallback callback) override;

    void Subscribe(const std::vector<std::string>& topics,
                   const SubscribeOptions& options,
                   SubscribeCallback callback) override;

    void End() override;

    bool IsConnected() const override { return connected_.load(); }

private:
    struct PendingSubscribe {
        std::vector<std::string> topics;
        SubscribeCallback callback;
    };

    // mosquitto 回调（在 mosquitto 网络线程中执行）
    static void on_connect_static(struct mosquitto* m, void* obj, int rc);                                  // NOLINT
    static void on_disconnect_static(struct mosquitto* m, void* obj, int rc);                               // NOLINT
    static void on_publish_static(struct mosquitto* m, void* obj, int mid);                                 // NOLINT
    static void on_subscribe_static(struct mosquitto* m, void* obj, int mid, int qos_count, const int* granted_qos);  // NOLINT
    static void on_message_static(struct mosquitto* m, void* obj, const mosquitto_message* msg);            // NOLINT
    static void on_log_static(struct mosquitto* m, void* obj, int level, const char* str);                  // NOLINT

    // 以下在事件循环线程中执行
    void HandleConnect(int rc);
    void HandleDisconnect(int rc);
    void HandlePublished(int mid);
    void HandleSubscribed(int mid, const std::vector<int>& granted);
    void HandleMessage(const std::string& topic, const std::string& payload);
    void HandleConnectTimeout(int timeout_ms);

    // 投递到事件循环；End() 之后投递的事件被丢弃
    void PostToLoop(std::function<void()> fn);

    void ApplyWill(const nlohmann::json& will);
    bool ApplyTls(const nlohmann::json& extra);
    void FailInflight(const PubSubError& error);
    void FailPublishes(std::vector<PublishCallback> callbacks, const PubSubError& error);

private:
    my_loop::IExecutor&                     executor_;
    struct mosquitto*                       mosq_{nullptr};             // mosquitto 客户端句柄
    ITransportListener*                     listener_{nullptr};
    std::shared_ptr<char>                   alive_;                     // 投递事件的有效性标记
    std::atomic<bool>                       connected_{false};          // socket 是否在线
    std::atomic<bool>                       ending_{false};             // 是否正在/已经 End
    bool                                    offline_reported_{false};   // 本轮断线是否已通知 offline
    bool                                    connected_once_{false};     // 是否收到过 CONNACK
    std::string                             address_;                   // 用于日志
    PublishTracker                          publish_inflight_;          // mid -> qos + 回调
    std::map<int, PendingSubscribe>         subscribe_inflight_;        // mid -> 回调
};

} // namespace my_pubsub
