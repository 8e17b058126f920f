#include "ConnectionManager.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "MyLog.h"

namespace my_pubsub {

ConnectionManager::ConnectionManager(TransportFactory factory)
    : factory_(std::move(factory))
{
}

ConnectionManager::~ConnectionManager() {
    observers_.clear();
    Close();
}

ITransport* ConnectionManager::Initialize(const std::string& broker_address,
                                          const nlohmann::json& options) {
    if (transport_ && state_ == ConnectionState::Connected) {
        MYLOG_INFO("ConnectionManager already connected to {}", broker_address_);
        return transport_.get();
    }
    if (state_ == ConnectionState::Connecting) {
        MYLOG_INFO("ConnectionManager connection to {} in progress", broker_address_);
        return transport_.get();
    }

    BrokerAddress address;
    std::string err;
    if (!ParseBrokerAddress(broker_address, address, &err)) {
        MYLOG_ERROR("ConnectionManager Initialize failed: {}", err);
        return nullptr;
    }

    ConnectionConfig cfg;
    try {
        cfg = ConnectionConfig::FromJson(options);
    } catch (const nlohmann::json::exception& e) {
        MYLOG_ERROR("ConnectionManager Initialize failed: bad options {}", e.what());
        return nullptr;
    }

    if (!factory_) {
        MYLOG_ERROR("ConnectionManager Initialize failed: no transport factory");
        return nullptr;
    }

    if (transport_) {
        // 上一个 Transport 已离线，换新的之前先释放
        MYLOG_WARN("ConnectionManager replacing offline transport for {}", broker_address_);
        ReleaseTransport();
    }

    auto transport = factory_();
    if (!transport) {
        MYLOG_ERROR("ConnectionManager Initialize failed: transport factory returned null");
        return nullptr;
    }

    config_ = std::move(cfg);
    broker_address_ = broker_address;
    state_ = ConnectionState::Connecting;

    MYLOG_INFO("ConnectionManager initializing broker={} client_id={}", broker_address_, config_.client_id);

    transport->SetListener(this);
    transport_ = std::move(transport);
    if (!transport_->Connect(address, config_)) {
        MYLOG_ERROR("ConnectionManager failed to open transport to {}", broker_address_);
        ReleaseTransport();
        state_ = ConnectionState::Disconnected;
        return nullptr;
    }
    return transport_.get();
}

bool ConnectionManager::IsReady() const {
    return state_ == ConnectionState::Connected && transport_ && transport_->IsConnected();
}

void ConnectionManager::Close() {
    if (!transport_) {
        state_ = ConnectionState::Disconnected;
        return;
    }
    MYLOG_INFO("ConnectionManager closing connection to {}", broker_address_);
    ReleaseTransport();
    state_ = ConnectionState::Disconnected;
}

void ConnectionManager::AddObserver(IConnectionObserver* observer) {
    if (!observer) return;
    if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) return;
    observers_.push_back(observer);
}

void ConnectionManager::RemoveObserver(IConnectionObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

template <typename Fn>
void ConnectionManager::Notify(const char* event, Fn&& fn) {
    // 回调中可能增删 observer，遍历快照并跳过已移除的
    const auto snapshot = observers_;
    for (auto* o : snapshot) {
        if (std::find(observers_.begin(), observers_.end(), o) == observers_.end()) continue;
        try {
            fn(o);
        } catch (const std::exception& e) {
            MYLOG_ERROR("ConnectionManager observer exception event={} err={}", event, e.what());
        } catch (...) {
            MYLOG_ERROR("ConnectionManager observer unknown exception event={}", event);
        }
    }
}

nlohmann::json ConnectionManager::GetStatus() const {
    nlohmann::json j;
    j["state"] = ToString(state_);
    j["ready"] = IsReady();
    j["broker"] = broker_address_;
    j["client_id"] = config_.client_id;
    j["connect_count"] = connect_count_;
    j["error_count"] = error_count_;
    j["last_error"] = last_error_;
    j["observers"] = observers_.size();
    return j;
}

void ConnectionManager::OnTransportConnect() {
    DispatchScope dispatch(*this);
    state_ = ConnectionState::Connected;
    ++connect_count_;
    MYLOG_INFO("ConnectionManager connected to {} (#{})", broker_address_, connect_count_);
    Notify("connected", [](IConnectionObserver* o) { o->OnConnected(); });
}

void ConnectionManager::OnTransportError(const std::string& description) {
    DispatchScope dispatch(*this);
    ++error_count_;
    last_error_ = description;
    MYLOG_ERROR("ConnectionManager transport error: {}", description);
    Notify("error", [&description](IConnectionObserver* o) { o->OnError(description); });
}

void ConnectionManager::OnTransportClose() {
    DispatchScope dispatch(*this);
    state_ = ConnectionState::Disconnected;
    MYLOG_INFO("ConnectionManager disconnected from {}", broker_address_);
    Notify("disconnected", [](IConnectionObserver* o) { o->OnDisconnected(); });
}

void ConnectionManager::OnTransportReconnect() {
    DispatchScope dispatch(*this);
    MYLOG_INFO("ConnectionManager reconnecting to {}", broker_address_);
    Notify("reconnecting", [](IConnectionObserver* o) { o->OnReconnecting(); });
}

void ConnectionManager::OnTransportOffline() {
    DispatchScope dispatch(*this);
    state_ = ConnectionState::Disconnected;
    MYLOG_WARN("ConnectionManager offline: broker {} unreachable", broker_address_);
    Notify("offline", [](IConnectionObserver* o) { o->OnOffline(); });
}

void ConnectionManager::OnTransportMessage(const std::string& topic, const std::string& payload) {
    DispatchScope dispatch(*this);
    Notify("message", [&topic, &payload](IConnectionObserver* o) { o->OnMessage(topic, payload); });
}

void ConnectionManager::ReleaseTransport() {
    auto transport = std::move(transport_);
    if (!transport) return;
    transport->SetListener(nullptr);
    transport->End();
    if (dispatch_depth_ > 0) {
        retired_.push_back(std::move(transport));
    }
}

void ConnectionManager::EndDispatch() {
    if (--dispatch_depth_ == 0) {
        retired_.clear();
    }
}

} // namespace my_pubsub
