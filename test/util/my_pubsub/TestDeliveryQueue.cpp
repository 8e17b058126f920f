#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ConnectionManager.hpp"
#include "DeliveryQueue.hpp"
#include "FakeTransport.h"
#include "ManualExecutor.h"

using namespace my_pubsub;
using std::chrono::milliseconds;

namespace {

struct Outcome {
    int success{0};
    int failure{0};
    PubSubError last_failure;
};

DeliveryHandlers Track(Outcome& o) {
    return DeliveryHandlers{
        [&o]() { ++o.success; },
        [&o](const PubSubError& e) {
            ++o.failure;
            o.last_failure = e;
        }};
}

struct Done {
    int calls{0};
    PubSubError error;
};

PublishCallback Capture(Done& d) {
    return [&d](const PubSubError& e) {
        ++d.calls;
        d.error = e;
    };
}

PubSubError SendFailure(const std::string& what) {
    return PubSubError::Make(PubSubErrc::TransportSendFailure, what);
}

class DeliveryQueueTest : public ::testing::Test {
protected:
    DeliveryQueueTest()
        : manager([this]() {
              auto t = std::make_unique<FakeTransport>(&stats);
              fake = t.get();
              return std::unique_ptr<ITransport>(std::move(t));
          })
        , queue(manager, executor, DeliveryConfig{5, 1000})
    {
    }

    // 连接并确认 Transport 就绪
    void Connect() {
        if (!manager.GetClient()) {
            ASSERT_NE(manager.Initialize("mqtt://broker.local:1883"), nullptr);
        }
        fake->FireConnect();
        ASSERT_TRUE(manager.IsReady());
    }

    // 让最新一次 publish 以给定结果完成
    void CompleteLast(const PubSubError& error) {
        ASSERT_FALSE(fake->publishes.empty());
        fake->CompletePublish(fake->publishes.size() - 1, error);
    }

    FakeTransportStats stats;
    FakeTransport* fake{nullptr};
    my_loop::ManualExecutor executor;
    ConnectionManager manager;
    DeliveryQueue queue;
};

} // namespace

TEST_F(DeliveryQueueTest, PublishBeforeInitializeFailsImmediately) {
    Done done;
    Outcome outcome;
    queue.Publish("sensors/1", "42", PublishOptions{}, Capture(done), Track(outcome));

    EXPECT_EQ(done.calls, 1);
    EXPECT_EQ(done.error.code, PubSubErrc::NotInitialized);
    EXPECT_EQ(done.error.message, "MQTT client not initialized");
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(outcome.success + outcome.failure, 0);
}

TEST_F(DeliveryQueueTest, PublishRejectsInvalidArguments) {
    Connect();
    Done empty_topic;
    queue.Publish("", "x", PublishOptions{}, Capture(empty_topic));
    EXPECT_EQ(empty_topic.error.code, PubSubErrc::InvalidArgument);

    PublishOptions bad;
    bad.qos = 3;
    Done bad_qos;
    queue.Publish("a/b", "x", bad, Capture(bad_qos));
    EXPECT_EQ(bad_qos.error.code, PubSubErrc::InvalidArgument);

    EXPECT_TRUE(fake->publishes.empty());
    EXPECT_EQ(queue.Size(), 0u);
}

TEST_F(DeliveryQueueTest, PublishWhileDisconnectedQueuesAndDeliversOnConnect) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);

    Done done;
    Outcome outcome;
    queue.Publish("sensors/1", "42", PublishOptions{}, Capture(done), Track(outcome));

    // 已接受，尚未送达
    EXPECT_EQ(done.calls, 1);
    EXPECT_TRUE(done.error.IsOk());
    EXPECT_EQ(queue.Size(), 1u);
    EXPECT_TRUE(fake->publishes.empty());

    fake->FireConnect();
    ASSERT_EQ(fake->publishes.size(), 1u);
    EXPECT_EQ(fake->publishes[0].topic, "sensors/1");
    EXPECT_EQ(fake->publishes[0].payload, "42");
    EXPECT_EQ(fake->publishes[0].options.qos, 1);
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.InFlight(), 1u);

    fake->CompletePublish(0);
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.InFlight(), 0u);
    EXPECT_EQ(outcome.success, 1);
    EXPECT_EQ(outcome.failure, 0);
    EXPECT_EQ(done.calls, 1);
}

TEST_F(DeliveryQueueTest, DirectPublishSuccess) {
    Connect();
    Done done;
    Outcome outcome;
    queue.Publish("sensors/2", "on", PublishOptions{}, Capture(done), Track(outcome));

    // 回调不会在 Publish 内同步触发
    EXPECT_EQ(done.calls, 0);
    ASSERT_EQ(fake->publishes.size(), 1u);

    fake->CompletePublish(0);
    EXPECT_EQ(done.calls, 1);
    EXPECT_TRUE(done.error.IsOk());
    EXPECT_EQ(outcome.success, 1);
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.GetStats()["delivered"], 1);
}

TEST_F(DeliveryQueueTest, ThrowingSuccessHandlerStillCompletesDelivery) {
    Connect();
    Done done;
    DeliveryHandlers handlers;
    handlers.on_success = []() { throw 5; };
    queue.Publish("sensors/3", "on", PublishOptions{}, Capture(done), std::move(handlers));

    ASSERT_EQ(fake->publishes.size(), 1u);
    EXPECT_NO_THROW(fake->CompletePublish(0));
    EXPECT_EQ(done.calls, 1);
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.GetStats()["delivered"], 1);
}

TEST_F(DeliveryQueueTest, DirectPublishFailureRejectsCallerAndQueues) {
    Connect();
    Done done;
    Outcome outcome;
    queue.Publish("sensors/3", "x", PublishOptions{}, Capture(done), Track(outcome));
    CompleteLast(SendFailure("broker unavailable"));

    EXPECT_EQ(done.calls, 1);
    EXPECT_EQ(done.error.code, PubSubErrc::TransportSendFailure);
    EXPECT_EQ(done.error.message, "broker unavailable");

    ASSERT_EQ(queue.Size(), 1u);
    const auto pending = queue.ListPending();
    EXPECT_EQ(pending[0].topic, "sensors/3");
    EXPECT_EQ(pending[0].retry_count, 0);
    EXPECT_EQ(outcome.success + outcome.failure, 0);

    // 等到下一次 flush 才重试
    EXPECT_EQ(fake->PendingPublishes(), 0u);
    fake->FireConnect();
    EXPECT_EQ(fake->PendingPublishes(), 1u);
    CompleteLast(PubSubError::Ok());
    EXPECT_EQ(outcome.success, 1);
    EXPECT_EQ(done.calls, 1);
}

TEST_F(DeliveryQueueTest, FlushFailureBacksOffLinearly) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Publish("t/1", "p", PublishOptions{}, nullptr);
    Connect();
    ASSERT_EQ(fake->publishes.size(), 1u);

    CompleteLast(SendFailure("e1"));
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.GetStats()["backoff_pending"], 1);

    executor.AdvanceBy(milliseconds(999));
    EXPECT_EQ(fake->publishes.size(), 1u);
    executor.AdvanceBy(milliseconds(1));
    ASSERT_EQ(fake->publishes.size(), 2u);

    CompleteLast(SendFailure("e2"));
    executor.AdvanceBy(milliseconds(1999));
    EXPECT_EQ(fake->publishes.size(), 2u);
    executor.AdvanceBy(milliseconds(1));
    ASSERT_EQ(fake->publishes.size(), 3u);

    CompleteLast(PubSubError::Ok());
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.GetStats()["retried"], 2);
    EXPECT_EQ(queue.GetStats()["delivered"], 1);
}

TEST_F(DeliveryQueueTest, DropsAfterMaxRetriesAndFiresFailureOnce) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    Outcome outcome;
    queue.Publish("alerts/fire", "!", PublishOptions{}, nullptr, Track(outcome));
    Connect();

    for (int attempt = 1; attempt <= 6; ++attempt) {
        ASSERT_EQ(fake->publishes.size(), static_cast<std::size_t>(attempt));
        CompleteLast(SendFailure("failure " + std::to_string(attempt)));
        if (attempt < 6) {
            EXPECT_EQ(outcome.failure, 0);
            executor.AdvanceBy(milliseconds(1000 * attempt));
        }
    }

    EXPECT_EQ(outcome.failure, 1);
    EXPECT_EQ(outcome.success, 0);
    EXPECT_EQ(outcome.last_failure.code, PubSubErrc::RetryExhausted);
    EXPECT_NE(outcome.last_failure.message.find("failure 6"), std::string::npos);
    EXPECT_EQ(outcome.last_failure.cause, PubSubErrc::TransportSendFailure);
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(executor.Pending(), 0u);

    // 丢弃后不再尝试
    queue.Flush();
    fake->FireConnect();
    executor.AdvanceBy(milliseconds(60000));
    EXPECT_EQ(fake->publishes.size(), 6u);
    EXPECT_EQ(outcome.failure, 1);
    EXPECT_EQ(queue.GetStats()["dropped"], 1);
}

TEST_F(DeliveryQueueTest, ZeroRetriesDropsOnFirstFlushFailure) {
    DeliveryQueue strict(manager, executor, DeliveryConfig{0, 1000});
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);

    Outcome outcome;
    strict.Publish("t/strict", "p", PublishOptions{}, nullptr, Track(outcome));
    Connect();
    ASSERT_EQ(fake->publishes.size(), 1u);

    CompleteLast(SendFailure("nope"));
    EXPECT_EQ(outcome.failure, 1);
    EXPECT_EQ(outcome.last_failure.code, PubSubErrc::RetryExhausted);
    EXPECT_EQ(strict.Size(), 0u);
}

TEST_F(DeliveryQueueTest, EachMessageAttemptedAtMostOncePerFlush) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Publish("t/a", "1", PublishOptions{}, nullptr);
    queue.Publish("t/b", "2", PublishOptions{}, nullptr);
    Connect();
    ASSERT_EQ(fake->publishes.size(), 2u);
    EXPECT_EQ(fake->publishes[0].topic, "t/a");
    EXPECT_EQ(fake->publishes[1].topic, "t/b");

    // 在途期间再次 flush 不会重复发送
    queue.Flush();
    fake->FireConnect();
    EXPECT_EQ(fake->publishes.size(), 2u);

    // 一条失败不影响另一条
    fake->CompletePublish(0, SendFailure("a failed"));
    fake->CompletePublish(1);
    EXPECT_EQ(queue.GetStats()["delivered"], 1);
    EXPECT_EQ(queue.GetStats()["backoff_pending"], 1);
}

TEST_F(DeliveryQueueTest, FlushIsNoOpWhenNotReady) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Publish("t/a", "1", PublishOptions{}, nullptr);
    queue.Flush();
    EXPECT_TRUE(fake->publishes.empty());
    EXPECT_EQ(queue.Size(), 1u);
    EXPECT_EQ(queue.GetStats()["flushes"], 0);
}

TEST_F(DeliveryQueueTest, BackoffExpiringWhileDisconnectedWaitsForConnect) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Publish("t/a", "1", PublishOptions{}, nullptr);
    Connect();
    CompleteLast(SendFailure("e1"));

    fake->FireClose();
    executor.AdvanceBy(milliseconds(1000));
    EXPECT_EQ(queue.Size(), 1u);
    EXPECT_EQ(fake->publishes.size(), 1u);
    EXPECT_EQ(queue.ListPending()[0].retry_count, 1);

    fake->FireConnect();
    EXPECT_EQ(fake->publishes.size(), 2u);
    EXPECT_EQ(queue.Size(), 0u);
}

TEST_F(DeliveryQueueTest, CloseKeepsQueuedMessages) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    Outcome outcome;
    for (int i = 0; i < 3; ++i) {
        queue.Publish("t/" + std::to_string(i), "p", PublishOptions{}, nullptr, Track(outcome));
    }
    ASSERT_EQ(queue.Size(), 3u);

    manager.Close();
    EXPECT_EQ(stats.ended, 1);
    EXPECT_EQ(manager.GetState(), ConnectionState::Disconnected);
    EXPECT_EQ(queue.Size(), 3u);
    EXPECT_EQ(outcome.success + outcome.failure, 0);

    // 关闭后不再接受新的 publish
    Done done;
    queue.Publish("t/late", "p", PublishOptions{}, Capture(done));
    EXPECT_EQ(done.error.code, PubSubErrc::NotInitialized);
    EXPECT_EQ(queue.Size(), 3u);
}

TEST_F(DeliveryQueueTest, QueuedMessagesSurviveReinitialize) {
    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Publish("t/a", "1", PublishOptions{}, nullptr);
    manager.Close();

    Connect();
    ASSERT_EQ(fake->publishes.size(), 1u);
    EXPECT_EQ(fake->publishes[0].topic, "t/a");
}

TEST_F(DeliveryQueueTest, SubscribeRequiresInitializedAndReady) {
    std::vector<PubSubError> errors;
    auto cb = [&errors](const PubSubError& e, const std::vector<GrantedSubscription>&) {
        errors.push_back(e);
    };

    queue.Subscribe({"a/b"}, SubscribeOptions{}, cb);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, PubSubErrc::NotInitialized);

    ASSERT_NE(manager.Initialize("mqtt://broker.local"), nullptr);
    queue.Subscribe({"a/b"}, SubscribeOptions{}, cb);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[1].code, PubSubErrc::NotReady);
    EXPECT_EQ(errors[1].message, "MQTT client not connected");
    EXPECT_TRUE(fake->subscribes.empty());

    queue.Subscribe({}, SubscribeOptions{}, cb);
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[2].code, PubSubErrc::InvalidArgument);
}

TEST_F(DeliveryQueueTest, SubscribeForwardsGrantedList) {
    Connect();
    PubSubError result = PubSubError::Make(PubSubErrc::NotReady, "unset");
    std::vector<GrantedSubscription> got;
    SubscribeOptions options;
    options.qos = 2;
    queue.Subscribe({"a/+", "b/#"}, options,
                    [&](const PubSubError& e, const std::vector<GrantedSubscription>& g) {
                        result = e;
                        got = g;
                    });

    ASSERT_EQ(fake->subscribes.size(), 1u);
    EXPECT_EQ(fake->subscribes[0].topics, std::vector<std::string>({"a/+", "b/#"}));
    EXPECT_EQ(fake->subscribes[0].options.qos, 2);

    fake->CompleteSubscribe(0, PubSubError::Ok(), {{"a/+", 2}, {"b/#", 128}});
    EXPECT_TRUE(result.IsOk());
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[1].qos, 128);
}

TEST_F(DeliveryQueueTest, CallbackAfterQueueDestroyedIsIgnored) {
    FakeTransport* transport = nullptr;
    {
        DeliveryQueue scoped(manager, executor);
        Connect();
        transport = fake;
        scoped.Publish("t/a", "1", PublishOptions{}, nullptr);
        ASSERT_EQ(transport->publishes.size(), 1u);
    }
    EXPECT_NO_THROW(transport->CompletePublish(0, SendFailure("late")));
    EXPECT_EQ(executor.Pending(), 0u);
}

TEST(DeliveryConfigTest, FromJson) {
    const auto defaults = DeliveryConfig::FromJson(nlohmann::json::object());
    EXPECT_EQ(defaults.max_retries, 5);
    EXPECT_EQ(defaults.retry_base_ms, 1000);

    const auto custom = DeliveryConfig::FromJson({{"max_retries", 2}, {"retry_base_ms", 250}});
    EXPECT_EQ(custom.max_retries, 2);
    EXPECT_EQ(custom.retry_base_ms, 250);
    EXPECT_EQ(custom.ToJson()["retry_base_ms"], 250);
}
