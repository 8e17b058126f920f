#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ManualExecutor.h"
#include "MosqTransport.hpp"

using namespace my_pubsub;

// 不连接 broker，只验证未连接状态下的失败路径与回调时机

TEST(MosqTransportTest, PublishBeforeConnectFailsAsynchronously) {
    my_loop::ManualExecutor executor;
    MosqTransport transport(executor);

    int calls = 0;
    PubSubError result;
    transport.Publish("a/b", "payload", PublishOptions{}, [&](const PubSubError& e) {
        ++calls;
        result = e;
    });

    EXPECT_EQ(calls, 0);
    executor.RunReady();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.code, PubSubErrc::TransportSendFailure);
    EXPECT_FALSE(transport.IsConnected());
}

TEST(MosqTransportTest, SubscribeBeforeConnectFailsAsynchronously) {
    my_loop::ManualExecutor executor;
    MosqTransport transport(executor);

    int calls = 0;
    PubSubError result;
    transport.Subscribe({"a/#"}, SubscribeOptions{},
                        [&](const PubSubError& e, const std::vector<GrantedSubscription>& granted) {
                            ++calls;
                            result = e;
                            EXPECT_TRUE(granted.empty());
                        });

    EXPECT_EQ(calls, 0);
    executor.RunReady();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.code, PubSubErrc::TransportSendFailure);
}

TEST(MosqTransportTest, EndIsIdempotentAndBlocksConnect) {
    my_loop::ManualExecutor executor;
    MosqTransport transport(executor);
    transport.End();
    transport.End();

    BrokerAddress address;
    ASSERT_TRUE(ParseBrokerAddress("mqtt://127.0.0.1:1883", address));
    EXPECT_FALSE(transport.Connect(address, ConnectionConfig::FromJson(nlohmann::json::object())));
    EXPECT_FALSE(transport.IsConnected());
}
