#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ITransport.hpp"
#include "PubSubTypes.hpp"

namespace my_pubsub {

/**
 * IConnectionObserver - 连接生命周期事件订阅者
 * 只需重写关心的事件；可注册任意数量
 */
class IConnectionObserver {
public:
    virtual ~IConnectionObserver() = default;

    virtual void OnConnected() {}
    virtual void OnDisconnected() {}
    virtual void OnReconnecting() {}
    virtual void OnOffline() {}
    virtual void OnError(const std::string& description) { (void)description; }
    virtual void OnMessage(const std::string& topic, const std::string& payload) { (void)topic; (void)payload; }
};

/**
 * @brief 管理唯一的 broker 连接
 *
 * @details
 * - 由组装层显式构造并持有；进程退出前由组装层调用 Close()
 * - 连接状态只由 Transport 事件驱动
 * - 所有方法都必须在事件循环线程中调用
 */
class ConnectionManager : public ITransportListener {
public:
    explicit ConnectionManager(TransportFactory factory);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief 建立连接
     *
     * 已连接或正在连接时直接返回现有 Transport，不会建立第二个连接。
     *
     * @param broker_address 例如 "mqtt://127.0.0.1:1883"
     * @param options 连接选项，见 ConnectionConfig
     * @return 底层 Transport（供高级用法直接使用）；失败返回 nullptr
     */
    ITransport* Initialize(const std::string& broker_address,
                           const nlohmann::json& options = nlohmann::json::object());

    ITransport* GetClient() const { return transport_.get(); }

    /**
     * @brief 当前是否可以发送
     * 状态为 Connected 且 Transport 确认 socket 在线
     */
    bool IsReady() const;

    /**
     * @brief 关闭连接，状态重置为 Disconnected（幂等）
     */
    void Close();

    ConnectionState GetState() const { return state_; }

    void AddObserver(IConnectionObserver* observer);
    void RemoveObserver(IConnectionObserver* observer);

    const ConnectionConfig& GetConfig() const { return config_; }
    const std::string& GetBrokerAddress() const { return broker_address_; }

    nlohmann::json GetStatus() const;

    // ITransportListener
    void OnTransportConnect() override;
    void OnTransportError(const std::string& description) override;
    void OnTransportClose() override;
    void OnTransportReconnect() override;
    void OnTransportOffline() override;
    void OnTransportMessage(const std::string& topic, const std::string& payload) override;

private:
    template <typename Fn>
    void Notify(const char* event, Fn&& fn);

    // 释放当前 Transport；若正处于 Transport 事件回调中则延后析构
    void ReleaseTransport();

    // Transport 事件分发期间的作用域标记，离开作用域时（包括异常）结束分发
    class DispatchScope {
    public:
        explicit DispatchScope(ConnectionManager& owner) : owner_(owner) { ++owner_.dispatch_depth_; }
        ~DispatchScope() { owner_.EndDispatch(); }

        DispatchScope(const DispatchScope&) = delete;
        DispatchScope& operator=(const DispatchScope&) = delete;

    private:
        ConnectionManager& owner_;
    };

    void EndDispatch();

private:
    TransportFactory                            factory_;
    std::unique_ptr<ITransport>                 transport_;
    std::vector<std::unique_ptr<ITransport>>    retired_;           // 回调中被关闭、待析构的 Transport
    ConnectionState                             state_{ConnectionState::Disconnected};
    std::vector<IConnectionObserver*>           observers_;
    ConnectionConfig                            config_;
    std::string                                 broker_address_;
    int                                         dispatch_depth_{0};
    std::uint64_t                               connect_count_{0};  // 成功连接次数
    std::uint64_t                               error_count_{0};
    std::string                                 last_error_;
};

} // namespace my_pubsub
