#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <mosquitto.h>
#include <nlohmann/json.hpp>

#include "ConnectionManager.hpp"
#include "DeliveryQueue.hpp"
#include "EventLoop.h"
#include "MosqTransport.hpp"
#include "MyHeartbeatManager.h"
#include "MyLog.h"
#include "TopicRouter.hpp"

namespace {

std::atomic<bool> g_stop_requested{false};

void onSignal(int sig) {
    (void)sig;
    g_stop_requested.store(true);
}

bool loadConfig(const std::string& path, nlohmann::json& out) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        MyLog::Error("无法打开配置文件: " + path);
        return false;
    }
    try {
        out = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        MyLog::Error("配置文件解析失败 " + path + ": " + std::string(e.what()));
        return false;
    }
    if (!out.is_object()) {
        MyLog::Error("配置文件根节点必须是 object: " + path);
        return false;
    }
    return true;
}

void usage(const char* prog) {
    std::cout << "usage: " << prog << " [config.json]\n"
              << "  default config: config/fast_pubsub.json\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/fast_pubsub.json";
    if (argc > 1) {
        const std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    nlohmann::json cfg;
    if (!loadConfig(config_path, cfg)) {
        return 1;
    }
    MyLog::Init(cfg.value("log", nlohmann::json::object()));
    MYLOG_INFO("fast_pubsub_client starting, config={}", config_path);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    my_loop::EventLoop loop("pubsub");
    my_pubsub::ConnectionManager connection([&loop]() -> std::unique_ptr<my_pubsub::ITransport> {
        return std::make_unique<my_pubsub::MosqTransport>(loop);
    });
    my_pubsub::DeliveryQueue queue(connection, loop,
                                   my_pubsub::DeliveryConfig::FromJson(cfg.value("delivery", nlohmann::json::object())));
    my_pubsub::TopicRouter router(connection, queue);
    my_heartbeat::HeartbeatManager heartbeat(loop, connection, queue);

    nlohmann::json mqtt = cfg.value("mqtt", nlohmann::json::object());
    const std::string broker = mqtt.value("broker", std::string("mqtt://127.0.0.1:1883"));
    mqtt.erase("broker");

    int exit_code = 0;

    loop.Post([&]() {
        const nlohmann::json subs = cfg.value("subscriptions", nlohmann::json::array());
        for (const auto& s : subs) {
            const std::string filter = s.value("topic", std::string());
            router.AddRoute(filter,
                            [](const std::string& topic, const std::string& payload) {
                                MYLOG_INFO("[message] topic={} payload={}", topic, payload);
                            },
                            s.value("qos", 1));
        }

        if (!connection.Initialize(broker, mqtt)) {
            MYLOG_ERROR("fast_pubsub_client: failed to initialize connection to {}", broker);
            exit_code = 2;
            loop.Stop();
            return;
        }

        if (cfg.contains("heartbeat")) {
            heartbeat.Init(cfg["heartbeat"]);
            heartbeat.Start();
        }
    });

    // 信号处理函数只置标记，由事件循环轮询后执行关闭流程
    std::function<void()> watch_stop = [&]() {
        if (!g_stop_requested.load()) {
            loop.PostDelayed(std::chrono::milliseconds(200), watch_stop);
            return;
        }
        MYLOG_INFO("shutdown requested, connection={} delivery={}",
                   connection.GetStatus().dump(), queue.GetStats().dump());
        heartbeat.Stop();
        connection.Close();
        loop.Stop();
    };
    loop.PostDelayed(std::chrono::milliseconds(200), watch_stop);

    loop.Run();

    // 注意：mosquitto_lib_cleanup 是全局的，所有 Transport 释放之后再调用
    connection.Close();
    mosquitto_lib_cleanup();

    MYLOG_INFO("fast_pubsub_client exit code={}", exit_code);
    MyLog::Shutdown();
    return exit_code;
}
