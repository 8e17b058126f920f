#include "DeliveryQueue.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "MyLog.h"

namespace my_pubsub {

DeliveryConfig DeliveryConfig::FromJson(const nlohmann::json& j) {
    DeliveryConfig cfg;
    if (!j.is_object()) return cfg;
    cfg.max_retries = j.value("max_retries", cfg.max_retries);
    cfg.retry_base_ms = j.value("retry_base_ms", cfg.retry_base_ms);
    return cfg;
}

nlohmann::json DeliveryConfig::ToJson() const {
    nlohmann::json j;
    j["max_retries"] = max_retries;
    j["retry_base_ms"] = retry_base_ms;
    return j;
}

DeliveryQueue::DeliveryQueue(ConnectionManager& connection,
                             my_loop::IExecutor& executor,
                             DeliveryConfig config)
    : connection_(connection)
    , executor_(executor)
    , config_(config)
    , alive_(std::make_shared<char>(0))
{
    if (config_.max_retries < 0) config_.max_retries = 0;
    if (config_.retry_base_ms < 0) config_.retry_base_ms = 0;
    connection_.AddObserver(this);
}

DeliveryQueue::~DeliveryQueue() {
    connection_.RemoveObserver(this);
    if (!queue_.empty() || in_flight_ > 0 || backoff_pending_ > 0) {
        MYLOG_WARN("DeliveryQueue destroyed with unresolved messages queued={} in_flight={} backoff={}",
                   queue_.size(), in_flight_, backoff_pending_);
    }
}

void DeliveryQueue::Publish(const std::string& topic,
                            const std::string& payload,
                            const PublishOptions& options,
                            PublishCallback done,
                            DeliveryHandlers outcome) {
    if (topic.empty()) {
        Complete(done, PubSubError::Make(PubSubErrc::InvalidArgument, "topic is empty"));
        return;
    }
    if (options.qos < 0 || options.qos > 2) {
        Complete(done, PubSubError::Make(PubSubErrc::InvalidArgument,
                                         "invalid qos " + std::to_string(options.qos)));
        return;
    }

    ITransport* transport = connection_.GetClient();
    if (!transport) {
        MYLOG_ERROR("Publish failed: MQTT client not initialized topic={}", topic);
        Complete(done, PubSubError::Make(PubSubErrc::NotInitialized, "MQTT client not initialized"));
        return;
    }

    auto msg = std::make_shared<PendingMessage>();
    msg->id = next_id_++;
    msg->topic = topic;
    msg->payload = payload;
    msg->options = options;
    msg->outcome = std::move(outcome);

    if (!connection_.IsReady()) {
        MYLOG_INFO("MQTT not connected, queuing message topic={} id={}", topic, msg->id);
        Enqueue(msg);
        // 已接受、待投递
        Complete(done, PubSubError::Ok());
        return;
    }

    ++in_flight_;
    std::weak_ptr<char> alive = alive_;
    transport->Publish(topic, payload, options, [this, alive, msg, done](const PubSubError& error) {
        if (alive.expired()) return;
        --in_flight_;
        if (error) {
            MYLOG_ERROR("Failed to publish to {}: {}", msg->topic, error.ToString());
            // 入队等待重试，同时把本次失败告知调用方
            msg->last_error = error;
            Enqueue(msg);
            Complete(done, error);
            return;
        }
        MYLOG_DEBUG("Published to {} id={}", msg->topic, msg->id);
        ++delivered_;
        Complete(done, PubSubError::Ok());
        FireSuccess(msg);
    });
}

void DeliveryQueue::Subscribe(const std::vector<std::string>& topics,
                              const SubscribeOptions& options,
                              SubscribeCallback done) {
    auto fail = [&done](const PubSubError& error) {
        if (!done) return;
        try {
            done(error, {});
        } catch (const std::exception& e) {
            MYLOG_ERROR("Subscribe callback exception: {}", e.what());
        } catch (...) {
            MYLOG_ERROR("Subscribe callback unknown exception");
        }
    };

    if (topics.empty() ||
        std::any_of(topics.begin(), topics.end(), [](const std::string& t) { return t.empty(); })) {
        fail(PubSubError::Make(PubSubErrc::InvalidArgument, "empty topic in subscribe request"));
        return;
    }

    ITransport* transport = connection_.GetClient();
    if (!transport) {
        fail(PubSubError::Make(PubSubErrc::NotInitialized, "MQTT client not initialized"));
        return;
    }
    if (!connection_.IsReady()) {
        fail(PubSubError::Make(PubSubErrc::NotReady, "MQTT client not connected"));
        return;
    }

    std::weak_ptr<char> alive = alive_;
    transport->Subscribe(topics, options,
        [alive, done](const PubSubError& error, const std::vector<GrantedSubscription>& granted) {
            if (alive.expired()) return;
            if (error) {
                MYLOG_ERROR("Subscribe failed: {}", error.ToString());
            } else {
                for (const auto& g : granted) {
                    if (g.qos > 2) {
                        MYLOG_WARN("Subscription rejected by broker topic={} code={}", g.topic, g.qos);
                    } else {
                        MYLOG_INFO("Subscribed to {} qos={}", g.topic, g.qos);
                    }
                }
            }
            if (!done) return;
            try {
                done(error, granted);
            } catch (const std::exception& e) {
                MYLOG_ERROR("Subscribe callback exception: {}", e.what());
            } catch (...) {
                MYLOG_ERROR("Subscribe callback unknown exception");
            }
        });
}

void DeliveryQueue::Flush() {
    if (queue_.empty()) return;
    if (!connection_.IsReady()) {
        MYLOG_DEBUG("Flush skipped: connection not ready, queued={}", queue_.size());
        return;
    }

    // 取快照并清空，本轮之后新进入队列的消息不会被重复处理
    std::deque<MessagePtr> batch;
    batch.swap(queue_);
    ++flushes_;
    MYLOG_INFO("Flushing {} pending MQTT messages", batch.size());

    for (const auto& msg : batch) {
        Attempt(msg);
    }
}

std::vector<PendingInfo> DeliveryQueue::ListPending() const {
    std::vector<PendingInfo> out;
    out.reserve(queue_.size());
    for (const auto& m : queue_) {
        out.push_back(PendingInfo{m->id, m->topic, m->retry_count});
    }
    return out;
}

nlohmann::json DeliveryQueue::GetStats() const {
    nlohmann::json j;
    j["queued"] = queue_.size();
    j["in_flight"] = in_flight_;
    j["backoff_pending"] = backoff_pending_;
    j["delivered"] = delivered_;
    j["dropped"] = dropped_;
    j["retried"] = retried_;
    j["flushes"] = flushes_;
    j["config"] = config_.ToJson();
    return j;
}

void DeliveryQueue::OnConnected() {
    Flush();
}

void DeliveryQueue::Enqueue(MessagePtr msg) {
    queue_.push_back(std::move(msg));
}

void DeliveryQueue::Attempt(const MessagePtr& msg) {
    ITransport* transport = connection_.GetClient();
    if (!transport) {
        Enqueue(msg);
        return;
    }

    ++in_flight_;
    std::weak_ptr<char> alive = alive_;
    transport->Publish(msg->topic, msg->payload, msg->options, [this, alive, msg](const PubSubError& error) {
        if (alive.expired()) return;
        --in_flight_;
        if (error) {
            HandleAttemptFailed(msg, error);
            return;
        }
        MYLOG_INFO("Pending message delivered to {} id={} retries={}", msg->topic, msg->id, msg->retry_count);
        ++delivered_;
        FireSuccess(msg);
    });
}

void DeliveryQueue::HandleAttemptFailed(const MessagePtr& msg, const PubSubError& error) {
    msg->last_error = error;
    msg->retry_count += 1;

    if (msg->retry_count <= config_.max_retries) {
        MYLOG_WARN("Publish to {} failed, retry {}/{}: {}",
                   msg->topic, msg->retry_count, config_.max_retries, error.ToString());
        ScheduleRequeue(msg);
        return;
    }

    MYLOG_ERROR("Dropping message to {} after {} retries: {}",
                msg->topic, config_.max_retries, error.ToString());
    ++dropped_;
    PubSubError exhausted = PubSubError::Make(PubSubErrc::RetryExhausted,
                                              "dropped after " + std::to_string(config_.max_retries) +
                                              " retries, last error: " + error.ToString());
    exhausted.cause = error.code;
    FireFailure(msg, exhausted);
}

void DeliveryQueue::ScheduleRequeue(const MessagePtr& msg) {
    ++retried_;
    ++backoff_pending_;
    const auto delay = std::chrono::milliseconds(
        static_cast<long long>(config_.retry_base_ms) * msg->retry_count);

    std::weak_ptr<char> alive = alive_;
    executor_.PostDelayed(delay, [this, alive, msg]() {
        if (alive.expired()) return;
        --backoff_pending_;
        Enqueue(msg);
        // 已连接则立即再次 flush，不等下一次 connect 事件
        if (connection_.IsReady()) {
            Flush();
        }
    });
}

void DeliveryQueue::FireSuccess(const MessagePtr& msg) {
    auto handler = std::move(msg->outcome.on_success);
    msg->outcome = DeliveryHandlers{};
    if (!handler) return;
    try {
        handler();
    } catch (const std::exception& e) {
        MYLOG_ERROR("on_success handler exception topic={} err={}", msg->topic, e.what());
    } catch (...) {
        MYLOG_ERROR("on_success handler unknown exception topic={}", msg->topic);
    }
}

void DeliveryQueue::FireFailure(const MessagePtr& msg, const PubSubError& error) {
    auto handler = std::move(msg->outcome.on_failure);
    msg->outcome = DeliveryHandlers{};
    if (!handler) return;
    try {
        handler(error);
    } catch (const std::exception& e) {
        MYLOG_ERROR("on_failure handler exception topic={} err={}", msg->topic, e.what());
    } catch (...) {
        MYLOG_ERROR("on_failure handler unknown exception topic={}", msg->topic);
    }
}

void DeliveryQueue::Complete(const PublishCallback& done, const PubSubError& error) {
    if (!done) return;
    try {
        done(error);
    } catch (const std::exception& e) {
        MYLOG_ERROR("Publish callback exception: {}", e.what());
    } catch (...) {
        MYLOG_ERROR("Publish callback unknown exception");
    }
}

} // namespace my_pubsub
