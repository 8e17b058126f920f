#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "PubSubTypes.hpp"

namespace my_pubsub {

/**
 * ITransportListener - Transport 生命周期事件接收者
 * 所有事件都在事件循环线程中回调
 */
class ITransportListener {
public:
    virtual ~ITransportListener() = default;

    virtual void OnTransportConnect() = 0;
    virtual void OnTransportError(const std::string& description) = 0;
    virtual void OnTransportClose() = 0;
    virtual void OnTransportReconnect() = 0;
    virtual void OnTransportOffline() = 0;
    virtual void OnTransportMessage(const std::string& topic, const std::string& payload) = 0;
};

/**
 * ITransport - 底层 broker 连接的抽象
 * 核心逻辑只依赖该接口，便于替换实现（mosquitto / fake）
 *
 * 约定：Publish / Subscribe 的回调不在调用栈内同步触发，
 * 而是之后在事件循环线程中触发，且每个请求恰好回调一次。
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    // 只保存指针，不接管所有权；传 nullptr 解除
    virtual void SetListener(ITransportListener* listener) = 0;

    // 发起异步连接，之后由事件通知结果；返回 false 表示无法发起
    virtual bool Connect(const BrokerAddress& address, const ConnectionConfig& config) = 0;

    virtual void Publish(const std::string& topic,
                         const std::string& payload,
                         const PublishOptions& options,
                         PublishCallback callback) = 0;

    virtual void Subscribe(const std::vector<std::string>& topics,
                           const SubscribeOptions& options,
                           SubscribeCallback callback) = 0;

    // 断开连接并释放底层资源；在途请求以 ConnectionClosed 失败
    virtual void End() = 0;

    // socket 是否真实在线
    virtual bool IsConnected() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace my_pubsub
