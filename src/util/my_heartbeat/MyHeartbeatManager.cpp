#include "MyHeartbeatManager.h"
#include <unistd.h>
#include <chrono>

#include "MyLog.h"

namespace my_heartbeat {

HeartbeatManager::HeartbeatManager(my_loop::IExecutor& executor,
                                   my_pubsub::ConnectionManager& connection,
                                   my_pubsub::DeliveryQueue& queue)
    : executor_(executor)
    , connection_(connection)
    , queue_(queue)
{
}

HeartbeatManager::~HeartbeatManager() {
    Stop();
}

std::string HeartbeatManager::formatTopic(const std::string& fmt, const std::string& source) {
    std::string t = fmt;
    const std::string key = "{source}";
    size_t pos = 0;
    while ((pos = t.find(key, pos)) != std::string::npos) {
        t.replace(pos, key.length(), source);
        pos += source.length();
    }
    return t;
}

void HeartbeatManager::Init(const nlohmann::json& config) {
    config_ = config.is_object() ? config : nlohmann::json::object();
    MYLOG_INFO("初始化 HeartbeatManager 配置: {}", config_.dump(4));

    interval_sec_ = config_.value("interval_sec", 5);
    if (interval_sec_ < 1) {
        MYLOG_WARN("HeartbeatManager interval_sec={} invalid, using 1", interval_sec_);
        interval_sec_ = 1;
    }
    qos_ = config_.value("qos", 1);
    retain_ = config_.value("retain", false);

    source_id_ = config_.value("source_id", std::string());
    if (source_id_.empty()) {
        // 尝试用主机名作为默认 source_id
        char hn[128] = {0};
        if (gethostname(hn, sizeof(hn) - 1) == 0) {
            source_id_ = hn;
        } else {
            source_id_ = "unknown";
        }
    }

    topic_ = formatTopic(config_.value("topic_fmt", std::string("system/heartbeats/{source}")), source_id_);
    start_time_ = time(nullptr);
    MYLOG_INFO("HeartbeatManager initialized with interval: {} seconds, source_id={}, topic={}",
               interval_sec_, source_id_, topic_);
}

void HeartbeatManager::Start() {
    if (running_) {
        MYLOG_WARN("HeartbeatManager 已经在运行，忽略重复启动请求");
        return;
    }
    if (topic_.empty()) {
        MYLOG_ERROR("HeartbeatManager Start failed: not initialized");
        return;
    }
    MYLOG_INFO("Starting HeartbeatManager...");
    running_ = true;
    timer_token_ = std::make_shared<char>(0);

    // 立即发一次
    BuildHeartbeat();
    SendHeartbeat();
    ScheduleNext();
}

void HeartbeatManager::Stop() {
    if (!running_) return;
    running_ = false;
    timer_token_.reset();
    MYLOG_INFO("HeartbeatManager stopped after {} heartbeats", seq_);
}

void HeartbeatManager::ScheduleNext() {
    std::weak_ptr<char> token = timer_token_;
    executor_.PostDelayed(std::chrono::seconds(interval_sec_), [this, token]() {
        if (token.expired() || !running_) return;
        BuildHeartbeat();
        SendHeartbeat();
        ScheduleNext();
    });
}

void HeartbeatManager::BuildHeartbeat() {
    nlohmann::json base = config_.value("base", nlohmann::json::object());

    base["pid"] = getpid();
    base["timestamp"] = time(nullptr);
    base["uptime_sec"] = time(nullptr) - start_time_;
    base["source"] = source_id_;
    base["seq"] = seq_ + 1;

    heartbeat_data_ = nlohmann::json::object();

    heartbeat_data_["base"] = base;
    heartbeat_data_["connection"] = connection_.GetStatus();
    heartbeat_data_["delivery"] = queue_.GetStats();
    heartbeat_data_["extra"] = config_.value("extra", nlohmann::json::object());
}

void HeartbeatManager::SendHeartbeat() {
    ++seq_;
    my_pubsub::PublishOptions options;
    options.qos = qos_;
    options.retain = retain_;

    const std::uint64_t seq = seq_;
    queue_.Publish(topic_, heartbeat_data_.dump(), options,
        [seq](const my_pubsub::PubSubError& error) {
            if (error) {
                MYLOG_WARN("heartbeat #{} not sent: {}", seq, error.ToString());
            }
        },
        my_pubsub::DeliveryHandlers{
            nullptr,
            [seq](const my_pubsub::PubSubError& error) {
                MYLOG_ERROR("heartbeat #{} dropped: {}", seq, error.ToString());
            }});
}

} // namespace my_heartbeat
