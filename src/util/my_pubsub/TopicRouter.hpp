#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ConnectionManager.hpp"
#include "DeliveryQueue.hpp"

namespace my_pubsub {

using Handler = std::function<void(const std::string& topic, const std::string& payload)>;

/**
 * @brief 入站消息路由
 *
 * 注册的主题过滤器在每次连接成功后自动（重新）订阅，
 * 收到的消息按过滤器（支持 + / #）分发给对应 handler。
 */
class TopicRouter : public IConnectionObserver {
public:
    TopicRouter(ConnectionManager& connection, DeliveryQueue& queue);
    ~TopicRouter() override;

    TopicRouter(const TopicRouter&) = delete;
    TopicRouter& operator=(const TopicRouter&) = delete;

    /**
     * @brief 添加路由；已连接时立即订阅，否则在下次连接时订阅
     *
     * @param topicFilter 主题过滤器
     * @param handler 消息处理回调
     * @param qos 服务质量等级
     * @return handler 为空或过滤器非法时返回 false
     */
    bool AddRoute(std::string topicFilter, Handler handler, int qos = 1);

    std::size_t RouteCount() const { return routes_.size(); }

    nlohmann::json GetRoutes() const;

    static bool MatchTopicFilter(const std::string& filter, const std::string& topic);

    static bool IsValidFilter(const std::string& filter);

    // IConnectionObserver
    void OnConnected() override;
    void OnMessage(const std::string& topic, const std::string& payload) override;

private:
    struct Route {
        std::string filter;
        Handler handler;
        int qos{1};
        bool subscribed{false};
    };

    void SubscribeRoute(std::size_t index);

private:
    ConnectionManager&      connection_;
    DeliveryQueue&          queue_;
    std::vector<Route>      routes_;
    std::shared_ptr<char>   alive_;
};

} // namespace my_pubsub
