#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace my_pubsub {

/**
 * @brief 连接状态（互斥）
 * 只由 Transport 回调驱动，外部模块不能直接修改
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
};

const char* ToString(ConnectionState state);

enum class PubSubErrc {
    Ok = 0,
    NotInitialized,         // 尚未创建 Transport
    NotReady,               // Transport 存在但当前未连接（仅 subscribe）
    InvalidArgument,        // topic 为空 / qos 越界等
    TransportSendFailure,   // broker 拒绝或网络中断
    RetryExhausted,         // 超过重试上限被丢弃
    ConnectionClosed,       // Transport 被主动关闭，在途请求失败
};

const char* ToString(PubSubErrc code);

struct PubSubError {
    PubSubErrc code{PubSubErrc::Ok};
    std::string message;
    PubSubErrc cause{PubSubErrc::Ok};   // RetryExhausted 时为最后一次发送失败的错误码

    static PubSubError Ok() { return PubSubError{}; }
    static PubSubError Make(PubSubErrc code, std::string message);

    bool IsOk() const { return code == PubSubErrc::Ok; }
    explicit operator bool() const { return code != PubSubErrc::Ok; }

    std::string ToString() const;
};

struct PublishOptions {
    int qos{1};
    bool retain{false};
};

struct SubscribeOptions {
    int qos{1};
};

/**
 * @brief broker 授权的订阅结果
 * qos 为 broker 协商后的等级；128 表示该 topic 被拒绝（MQTT 3.1.1）
 */
struct GrantedSubscription {
    std::string topic;
    int qos{0};
};

// 调用方的即时完成回调（相当于 promise 的 resolve/reject）
using PublishCallback = std::function<void(const PubSubError& error)>;
using SubscribeCallback = std::function<void(const PubSubError& error,
                                             const std::vector<GrantedSubscription>& granted)>;

/**
 * @brief 消息最终投递结果的回调，创建消息时绑定，整个生命周期内恰好触发一次
 */
struct DeliveryHandlers {
    std::function<void()> on_success;
    std::function<void(const PubSubError& error)> on_failure;
};

struct BrokerAddress {
    std::string scheme;     // mqtt / tcp / mqtts / ssl
    std::string host;
    int port{1883};
    bool tls{false};

    std::string ToString() const;
};

/**
 * @brief 解析 broker 地址
 * 支持 "mqtt://host:port" "tcp://host:port" "mqtts://host" "host:port" "host"
 *
 * @param url 地址字符串
 * @param out 解析结果
 * @param err 可选，失败原因
 * @return 是否解析成功
 */
bool ParseBrokerAddress(const std::string& url, BrokerAddress& out, std::string* err = nullptr);

/**
 * @brief initialize 时生效的连接配置
 *
 * options 示例：
 * {
 *   "username": "", "password": "",
 *   "reconnectPeriod": 1000,     // ms
 *   "connectTimeout": 30000,     // ms
 *   "clientId": "app_01",
 *   "clean": true,
 *   "keepalive": 60              // 未识别的选项原样放入 extra，交给 Transport
 * }
 */
struct ConnectionConfig {
    std::string username;
    std::string password;
    int reconnect_period_ms{1000};
    int connect_timeout_ms{30000};
    std::string client_id;
    bool clean{true};
    nlohmann::json extra = nlohmann::json::object();

    // 缺省值：用户名/密码回退到环境变量 MQTT_USERNAME / MQTT_PASSWORD，clientId 自动生成
    static ConnectionConfig FromJson(const nlohmann::json& options);

    nlohmann::json ToJson() const;
};

std::string GenerateClientId(const std::string& prefix = "fast_pubsub");

} // namespace my_pubsub
