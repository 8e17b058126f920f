#include <gtest/gtest.h>

#include <vector>

#include "PublishTracker.hpp"

using namespace my_pubsub;

namespace {

PublishCallback Record(std::vector<int>& seen, int tag) {
    return [&seen, tag](const PubSubError&) { seen.push_back(tag); };
}

} // namespace

TEST(PublishTrackerTest, DisconnectTakesOnlyQos0) {
    PublishTracker tracker;
    std::vector<int> seen;
    tracker.Add(1, 0, Record(seen, 1));
    tracker.Add(2, 1, Record(seen, 2));
    tracker.Add(3, 0, Record(seen, 3));
    tracker.Add(4, 2, Record(seen, 4));

    auto lost = tracker.TakeQos0();
    ASSERT_EQ(lost.size(), 2u);
    for (auto& cb : lost) cb(PubSubError::Make(PubSubErrc::TransportSendFailure, "lost"));
    EXPECT_EQ(seen, std::vector<int>({1, 3}));

    // QoS 1/2 仍等待 on_publish
    EXPECT_EQ(tracker.Size(), 2u);
    PublishCallback cb;
    ASSERT_TRUE(tracker.Take(2, cb));
    cb(PubSubError::Ok());
    EXPECT_EQ(seen, std::vector<int>({1, 3, 2}));
}

TEST(PublishTrackerTest, LateAckForFailedQos0IsIgnored) {
    PublishTracker tracker;
    std::vector<int> seen;
    tracker.Add(7, 0, Record(seen, 7));
    ASSERT_EQ(tracker.TakeQos0().size(), 1u);

    PublishCallback cb;
    EXPECT_FALSE(tracker.Take(7, cb));
    EXPECT_FALSE(tracker.Take(99, cb));
    EXPECT_FALSE(cb);
}

TEST(PublishTrackerTest, TakeAllEmptiesTracker) {
    PublishTracker tracker;
    std::vector<int> seen;
    tracker.Add(1, 0, Record(seen, 1));
    tracker.Add(2, 1, Record(seen, 2));

    auto all = tracker.TakeAll();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(tracker.Size(), 0u);
    EXPECT_TRUE(tracker.TakeQos0().empty());
}
