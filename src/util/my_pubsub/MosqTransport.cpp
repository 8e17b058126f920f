#include "MosqTransport.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <utility>

#include "MyLog.h"

namespace my_pubsub {

static std::atomic<bool> g_mosq_inited{false};

MosqTransport::MosqTransport(my_loop::IExecutor& executor)
    : executor_(executor)
    , alive_(std::make_shared<char>(0))
{
}

MosqTransport::~MosqTransport() {
    End();
}

void MosqTransport::SetListener(ITransportListener* listener) {
    listener_ = listener;
}

bool MosqTransport::Connect(const BrokerAddress& address, const ConnectionConfig& config) {
    if (ending_.load()) {
        MYLOG_ERROR("MosqTransport Connect rejected: transport already ended");
        return false;
    }
    if (mosq_) {
        MYLOG_WARN("MosqTransport Connect ignored: already connecting to {}", address_);
        return false;
    }

    if (!g_mosq_inited.exchange(true)) {
        mosquitto_lib_init();
    }

    address_ = address.ToString();

    // 创建 mosquitto client；user data 指向 this
    mosq_ = mosquitto_new(config.client_id.c_str(), config.clean, this);
    if (!mosq_) {
        MYLOG_ERROR("mosquitto_new failed client_id={}", config.client_id);
        return false;
    }

    if (!config.username.empty()) {
        int rc = mosquitto_username_pw_set(mosq_,
                                           config.username.c_str(),
                                           config.password.empty() ? nullptr : config.password.c_str());
        if (rc != MOSQ_ERR_SUCCESS) {
            MYLOG_ERROR("mosquitto_username_pw_set failed: {}", mosquitto_strerror(rc));
            mosquitto_destroy(mosq_);
            mosq_ = nullptr;
            return false;
        }
    }

    // mosquitto 的重连间隔以秒为单位
    int reconnect_sec = (config.reconnect_period_ms + 999) / 1000;
    if (reconnect_sec < 1) {
        MYLOG_WARN("reconnectPeriod={}ms not supported, using 1s", config.reconnect_period_ms);
        reconnect_sec = 1;
    }
    mosquitto_reconnect_delay_set(mosq_, reconnect_sec, reconnect_sec, false);

    if (config.extra.contains("will") && config.extra["will"].is_object()) {
        ApplyWill(config.extra["will"]);
    }

    if (address.tls && !ApplyTls(config.extra)) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
        return false;
    }

    mosquitto_connect_callback_set(mosq_, &MosqTransport::on_connect_static);
    mosquitto_disconnect_callback_set(mosq_, &MosqTransport::on_disconnect_static);
    mosquitto_publish_callback_set(mosq_, &MosqTransport::on_publish_static);
    mosquitto_subscribe_callback_set(mosq_, &MosqTransport::on_subscribe_static);
    mosquitto_message_callback_set(mosq_, &MosqTransport::on_message_static);
    mosquitto_log_callback_set(mosq_, &MosqTransport::on_log_static);

    const int keepalive = config.extra.value("keepalive", 60);

    // 非阻塞连接；失败时 mosquitto 网络线程会按重连间隔继续尝试
    int rc = mosquitto_connect_async(mosq_, address.host.c_str(), address.port, keepalive);
    if (rc != MOSQ_ERR_SUCCESS) {
        const std::string reason = std::string("connect to ") + address_ + " failed: " + mosquitto_strerror(rc);
        MYLOG_WARN("MosqTransport {}", reason);
        PostToLoop([this, reason]() {
            if (!listener_) return;
            std::weak_ptr<char> alive = alive_;
            listener_->OnTransportError(reason);
            // 上层可能在回调中 Close，本对象随之销毁
            if (alive.expired() || !listener_) return;
            offline_reported_ = true;
            listener_->OnTransportOffline();
        });
    }

    rc = mosquitto_loop_start(mosq_);
    if (rc != MOSQ_ERR_SUCCESS) {
        MYLOG_ERROR("mosquitto_loop_start failed: {}", mosquitto_strerror(rc));
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
        return false;
    }

    if (config.connect_timeout_ms > 0) {
        std::weak_ptr<char> alive = alive_;
        const int timeout_ms = config.connect_timeout_ms;
        executor_.PostDelayed(std::chrono::milliseconds(timeout_ms), [this, alive, timeout_ms]() {
            if (alive.expired()) return;
            HandleConnectTimeout(timeout_ms);
        });
    }

    MYLOG_INFO("MosqTransport connecting to {} client_id={} keepalive={}", address_, config.client_id, keepalive);
    return true;
}

void MosqTransport::Publish(const std::string& topic,
                            const std::string& payload,
                            const PublishOptions& options,
                            PublishCallback callback) {
    auto fail = [this, &callback](const std::string& reason) {
        auto err = PubSubError::Make(PubSubErrc::TransportSendFailure, reason);
        executor_.Post([callback, err]() {
            if (callback) callback(err);
        });
    };

    if (!mosq_ || ending_.load()) {
        fail("transport not open");
        return;
    }
    if (!connected_.load()) {
        fail("transport not connected");
        return;
    }

    int mid = 0;
    int rc = mosquitto_publish(mosq_,
                               &mid,
                               topic.c_str(),
                               static_cast<int>(payload.size()),
                               payload.data(),
                               options.qos,
                               options.retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        MYLOG_ERROR("mosquitto_publish failed: {} topic={}", mosquitto_strerror(rc), topic);
        fail(mosquitto_strerror(rc));
        return;
    }
    // on_publish 会被投递到事件循环，一定在本次登记之后处理
    publish_inflight_.Add(mid, options.qos, std::move(callback));
}

void MosqTransport::Subscribe(const std::vector<std::string>& topics,
                              const SubscribeOptions& options,
                              SubscribeCallback callback) {
    auto fail = [this, &callback](const std::string& reason) {
        auto err = PubSubError::Make(PubSubErrc::TransportSendFailure, reason);
        executor_.Post([callback, err]() {
            if (callback) callback(err, {});
        });
    };

    if (!mosq_ || ending_.load()) {
        fail("transport not open");
        return;
    }

    std::vector<char*> subs;
    subs.reserve(topics.size());
    for (const auto& t : topics) {
        subs.push_back(const_cast<char*>(t.c_str()));
    }

    int mid = 0;
    int rc = mosquitto_subscribe_multiple(mosq_, &mid, static_cast<int>(subs.size()), subs.data(),
                                          options.qos, 0, nullptr);
    if (rc != MOSQ_ERR_SUCCESS) {
        MYLOG_ERROR("mosquitto_subscribe_multiple failed: {} count={}", mosquitto_strerror(rc), topics.size());
        fail(mosquitto_strerror(rc));
        return;
    }
    subscribe_inflight_[mid] = PendingSubscribe{topics, std::move(callback)};
}

void MosqTransport::End() {
    if (ending_.exchange(true)) return;

    listener_ = nullptr;

    if (mosq_) {
        int rc = mosquitto_disconnect(mosq_);
        if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
            MYLOG_WARN("mosquitto_disconnect returned {}", mosquitto_strerror(rc));
        }
        mosquitto_loop_stop(mosq_, true);
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
        MYLOG_INFO("MosqTransport closed {}", address_);
    }
    connected_.store(false);

    // 网络线程已停止，已投递但尚未执行的 mosquitto 事件全部作废
    alive_.reset();

    // 注意：mosquitto_lib_cleanup 是全局的，进程退出时再调用
    FailInflight(PubSubError::Make(PubSubErrc::ConnectionClosed, "transport ended"));
}

void MosqTransport::FailInflight(const PubSubError& error) {
    auto subscribes = std::move(subscribe_inflight_);
    subscribe_inflight_.clear();

    FailPublishes(publish_inflight_.TakeAll(), error);
    for (auto& kv : subscribes) {
        auto cb = std::move(kv.second.callback);
        executor_.Post([cb, error]() {
            if (cb) cb(error, {});
        });
    }
}

void MosqTransport::FailPublishes(std::vector<PublishCallback> callbacks, const PubSubError& error) {
    for (auto& cb : callbacks) {
        executor_.Post([cb, error]() {
            if (cb) cb(error);
        });
    }
}

void MosqTransport::PostToLoop(std::function<void()> fn) {
    std::weak_ptr<char> alive = alive_;
    if (alive.expired()) return;
    executor_.Post([alive, fn]() {
        if (alive.expired()) return;
        fn();
    });
}

void MosqTransport::ApplyWill(const nlohmann::json& will) {
    const std::string topic = will.value("topic", std::string());
    if (topic.empty()) {
        MYLOG_WARN("MosqTransport will ignored: topic is empty");
        return;
    }
    const std::string payload = will.value("payload", std::string());
    const int qos = will.value("qos", 1);
    const bool retain = will.value("retain", true);

    int rc = mosquitto_will_set(mosq_, topic.c_str(), static_cast<int>(payload.size()),
                                payload.c_str(), qos, retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        MYLOG_WARN("mosquitto_will_set failed: {} topic={}", mosquitto_strerror(rc), topic);
    } else {
        MYLOG_INFO("MosqTransport will set topic={} qos={} retain={}", topic, qos, retain);
    }
}

bool MosqTransport::ApplyTls(const nlohmann::json& extra) {
    const std::string ca_file = extra.value("ca_file", std::string());
    std::string ca_path = extra.value("ca_path", std::string());
    const std::string cert_file = extra.value("cert_file", std::string());
    const std::string key_file = extra.value("key_file", std::string());

    if (ca_file.empty() && ca_path.empty()) {
        ca_path = "/etc/ssl/certs";
    }

    auto opt = [](const std::string& s) -> const char* { return s.empty() ? nullptr : s.c_str(); };
    int rc = mosquitto_tls_set(mosq_, opt(ca_file), opt(ca_path), opt(cert_file), opt(key_file), nullptr);
    if (rc != MOSQ_ERR_SUCCESS) {
        MYLOG_ERROR("mosquitto_tls_set failed: {}", mosquitto_strerror(rc));
        return false;
    }
    return true;
}

// static callbacks
void MosqTransport::on_connect_static(struct mosquitto* m, void* obj, int rc) {
    (void)m;
    auto* self = static_cast<MosqTransport*>(obj);
    if (!self) return;
    if (rc == 0) self->connected_.store(true);
    self->PostToLoop([self, rc]() { self->HandleConnect(rc); });
}

void MosqTransport::on_disconnect_static(struct mosquitto* m, void* obj, int rc) {
    (void)m;
    auto* self = static_cast<MosqTransport*>(obj);
    if (!self) return;
    self->connected_.store(false);
    self->PostToLoop([self, rc]() { self->HandleDisconnect(rc); });
}

void MosqTransport::on_publish_static(struct mosquitto* m, void* obj, int mid) {
    (void)m;
    auto* self = static_cast<MosqTransport*>(obj);
    if (!self) return;
    self->PostToLoop([self, mid]() { self->HandlePublished(mid); });
}

void MosqTransport::on_subscribe_static(struct mosquitto* m, void* obj, int mid, int qos_count, const int* granted_qos) {
    (void)m;
    auto* self = static_cast<MosqTransport*>(obj);
    if (!self) return;
    std::vector<int> granted;
    if (granted_qos && qos_count > 0) {
        granted.assign(granted_qos, granted_qos + qos_count);
    }
    self->PostToLoop([self, mid, granted]() { self->HandleSubscribed(mid, granted); });
}

void MosqTransport::on_message_static(struct mosquitto* m, void* obj, const mosquitto_message* msg) {
    (void)m;
    auto* self = static_cast<MosqTransport*>(obj);
    if (!self || !msg || !msg->topic) return;

    std::string topic = msg->topic;
    std::string payload;
    if (msg->payload && msg->payloadlen > 0) {
        payload.assign(static_cast<const char*>(msg->payload),
                       static_cast<size_t>(msg->payloadlen));
    }
    self->PostToLoop([self, topic, payload]() { self->HandleMessage(topic, payload); });
}

void MosqTransport::on_log_static(struct mosquitto* m, void* obj, int level, const char* str) {
    (void)m; (void)obj; (void)level;
    if (str) MYLOG_DEBUG("[mosquitto] {}", str);
}

// instance handlers
void MosqTransport::HandleConnect(int rc) {
    if (rc != 0) {
        const std::string reason = std::string("connection refused: ") + mosquitto_connack_string(rc);
        MYLOG_WARN("MosqTransport {} broker={}", reason, address_);
        if (listener_) listener_->OnTransportError(reason);
        return;
    }
    offline_reported_ = false;
    connected_once_ = true;
    MYLOG_INFO("MosqTransport connected to {}", address_);
    if (listener_) listener_->OnTransportConnect();
}

void MosqTransport::HandleDisconnect(int rc) {
    // 未写出的 QoS 0 报文随断线丢失，mosquitto 不会再回调 on_publish
    auto lost = publish_inflight_.TakeQos0();
    if (!lost.empty()) {
        MYLOG_WARN("MosqTransport {} QoS 0 publish(es) lost on disconnect from {}", lost.size(), address_);
        FailPublishes(std::move(lost), PubSubError::Make(PubSubErrc::TransportSendFailure,
                                                         "connection lost before QoS 0 publish was sent"));
    }

    if (!listener_) return;
    std::weak_ptr<char> alive = alive_;
    listener_->OnTransportClose();
    if (rc == 0) return;     // 主动断开，不重连
    if (alive.expired() || !listener_) return;

    // 非预期断开：mosquitto 网络线程随后会按重连间隔尝试重连
    MYLOG_WARN("MosqTransport lost connection to {} rc={}", address_, rc);
    if (!offline_reported_) {
        offline_reported_ = true;
        listener_->OnTransportOffline();
        if (alive.expired() || !listener_) return;
    }
    listener_->OnTransportReconnect();
}

void MosqTransport::HandlePublished(int mid) {
    PublishCallback cb;
    if (!publish_inflight_.Take(mid, cb)) return;
    if (cb) cb(PubSubError::Ok());
}

void MosqTransport::HandleSubscribed(int mid, const std::vector<int>& granted) {
    auto it = subscribe_inflight_.find(mid);
    if (it == subscribe_inflight_.end()) return;
    PendingSubscribe pending = std::move(it->second);
    subscribe_inflight_.erase(it);

    std::vector<GrantedSubscription> result;
    const size_t n = std::min(pending.topics.size(), granted.size());
    for (size_t i = 0; i < n; ++i) {
        result.push_back(GrantedSubscription{pending.topics[i], granted[i]});
    }
    if (pending.callback) pending.callback(PubSubError::Ok(), result);
}

void MosqTransport::HandleMessage(const std::string& topic, const std::string& payload) {
    if (listener_) listener_->OnTransportMessage(topic, payload);
}

void MosqTransport::HandleConnectTimeout(int timeout_ms) {
    if (connected_once_ || ending_.load() || !listener_) return;
    MYLOG_WARN("MosqTransport connect to {} timed out after {}ms", address_, timeout_ms);
    listener_->OnTransportError("connect timeout after " + std::to_string(timeout_ms) + "ms");
}

} // namespace my_pubsub
