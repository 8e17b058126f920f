#include "TopicRouter.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "MyLog.h"

namespace my_pubsub {

static std::vector<std::string> splitTopic(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, '/')) out.push_back(item);
    // "a/" 末尾的空层级
    if (!s.empty() && s.back() == '/') out.emplace_back();
    return out;
}

TopicRouter::TopicRouter(ConnectionManager& connection, DeliveryQueue& queue)
    : connection_(connection)
    , queue_(queue)
    , alive_(std::make_shared<char>(0))
{
    connection_.AddObserver(this);
}

TopicRouter::~TopicRouter() {
    connection_.RemoveObserver(this);
}

bool TopicRouter::AddRoute(std::string topicFilter, Handler handler, int qos) {
    if (!handler) {
        MYLOG_WARN("AddRoute ignored: empty handler filter={}", topicFilter);
        return false;
    }
    if (!IsValidFilter(topicFilter)) {
        MYLOG_WARN("AddRoute ignored: invalid filter={}", topicFilter);
        return false;
    }

    routes_.push_back(Route{std::move(topicFilter), std::move(handler), qos, false});
    MYLOG_INFO("AddRoute ok filter={} qos={}", routes_.back().filter, qos);

    if (connection_.IsReady()) {
        SubscribeRoute(routes_.size() - 1);
    }
    return true;
}

nlohmann::json TopicRouter::GetRoutes() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : routes_) {
        arr.push_back({{"filter", r.filter}, {"qos", r.qos}, {"subscribed", r.subscribed}});
    }
    return arr;
}

void TopicRouter::OnConnected() {
    // 连接成功后（或重连后），为已注册的 routes 自动订阅主题
    for (auto& r : routes_) r.subscribed = false;
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        SubscribeRoute(i);
    }
}

void TopicRouter::OnMessage(const std::string& topic, const std::string& payload) {
    // handler 中可能再 AddRoute，遍历副本
    const std::vector<Route> routes_copy = routes_;
    bool matched = false;
    for (const auto& r : routes_copy) {
        if (!MatchTopicFilter(r.filter, topic)) continue;
        matched = true;
        try {
            r.handler(topic, payload);
        } catch (const std::exception& e) {
            MYLOG_ERROR("route handler exception filter={} err={}", r.filter, e.what());
        } catch (...) {
            MYLOG_ERROR("route handler unknown exception filter={}", r.filter);
        }
    }
    if (!matched) {
        MYLOG_DEBUG("no route for topic={}", topic);
    }
}

void TopicRouter::SubscribeRoute(std::size_t index) {
    const std::string filter = routes_[index].filter;
    SubscribeOptions options;
    options.qos = routes_[index].qos;

    std::weak_ptr<char> alive = alive_;
    queue_.Subscribe({filter}, options,
        [this, alive, filter](const PubSubError& error, const std::vector<GrantedSubscription>& granted) {
            if (alive.expired()) return;
            if (error) {
                MYLOG_WARN("Auto-subscribe failed for filter={} err={}", filter, error.ToString());
                return;
            }
            const bool accepted = !granted.empty() && granted.front().qos <= 2;
            for (auto& r : routes_) {
                if (r.filter == filter) r.subscribed = accepted;
            }
        });
}

bool TopicRouter::MatchTopicFilter(const std::string& filter, const std::string& topic) {
    const auto f = splitTopic(filter);
    const auto t = splitTopic(topic);

    // 以 $ 开头的系统主题不被首层通配符匹配
    if (!topic.empty() && topic.front() == '$' && !f.empty() && (f[0] == "+" || f[0] == "#")) {
        return false;
    }

    size_t i = 0;
    for (; i < f.size(); ++i) {
        const auto& fp = f[i];

        if (fp == "#") {
            return true; // match rest
        }

        if (i >= t.size()) return false;

        if (fp == "+") continue;

        if (fp != t[i]) return false;
    }

    return i == t.size();
}

bool TopicRouter::IsValidFilter(const std::string& filter) {
    if (filter.empty()) return false;
    const auto parts = splitTopic(filter);
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& p = parts[i];
        if (p == "#") {
            if (i + 1 != parts.size()) return false;
            continue;
        }
        if (p == "+") continue;
        if (p.find('#') != std::string::npos || p.find('+') != std::string::npos) return false;
    }
    return true;
}

} // namespace my_pubsub
