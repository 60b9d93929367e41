#include <gtest/gtest.h>

#include "ptrack/tracking/multi_object_tracker.hpp"
#include "ptrack/core/logger.hpp"

#include <limits>
#include <set>

using namespace ptrack;

namespace {

Detection make_detection(float x1, float y1, float x2, float y2, float conf = 0.9f) {
    Detection det;
    det.bbox = BoundingBox{x1, y1, x2, y2};
    det.confidence = conf;
    return det;
}

const TrackedObject* find_id(const TrackedObjects& objects, uint64_t id) {
    for (const auto& obj : objects) {
        if (obj.tracking_id == id) return &obj;
    }
    return nullptr;
}

}  // namespace

class MultiObjectTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("", LogLevel::OFF, LogLevel::OFF);
    }

    static TrackerConfig config_with(int max_age, int min_hits) {
        TrackerConfig tc;
        tc.max_age = max_age;
        tc.min_hits = min_hits;
        return tc;
    }
};

TEST_F(MultiObjectTrackerTest, EmptyFrameIsNoOp) {
    MultiObjectTracker tracker;

    auto objects = tracker.update({});

    EXPECT_TRUE(objects.empty());
    EXPECT_EQ(tracker.frame_count(), 1u);
    EXPECT_TRUE(tracker.tracks().empty());
}

TEST_F(MultiObjectTrackerTest, WarmUpEmitsNewTracks) {
    MultiObjectTracker tracker;

    auto objects = tracker.update({make_detection(100, 100, 150, 200)});

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
    EXPECT_EQ(objects[0].bbox, (PixelBox{100, 100, 150, 200}));
    EXPECT_EQ(objects[0].class_name, "person");
    EXPECT_EQ(objects[0].hit_streak, 0);

    // A track born inside the warm-up window is also reported
    objects = tracker.update({make_detection(100, 100, 150, 200),
                              make_detection(400, 100, 450, 200)});
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_NE(find_id(objects, 2), nullptr);
}

TEST_F(MultiObjectTrackerTest, IdsStableForMovingObjects) {
    MultiObjectTracker tracker;

    for (int frame = 0; frame < 10; ++frame) {
        const float dx = 2.0f * frame;
        auto objects = tracker.update({
            make_detection(100 + dx, 100, 150 + dx, 200),
            make_detection(400 - dx, 300, 450 - dx, 400),
        });

        ASSERT_EQ(objects.size(), 2u) << "frame " << frame;

        const TrackedObject* a = find_id(objects, 1);
        const TrackedObject* b = find_id(objects, 2);
        ASSERT_NE(a, nullptr);
        ASSERT_NE(b, nullptr);
        EXPECT_NEAR(a->bbox.x1, 100 + dx, 3);
        EXPECT_NEAR(b->bbox.y1, 300, 3);
    }

    EXPECT_EQ(tracker.stats().tracks_created, 2u);
}

TEST_F(MultiObjectTrackerTest, IdsUniqueWithinFrame) {
    MultiObjectTracker tracker;

    std::vector<Detection> dets;
    for (int i = 0; i < 6; ++i) {
        dets.push_back(make_detection(i * 100.0f, 0, i * 100.0f + 50, 80));
    }

    for (int frame = 0; frame < 5; ++frame) {
        auto objects = tracker.update(dets);
        std::set<uint64_t> ids;
        for (const auto& obj : objects) {
            EXPECT_GE(obj.tracking_id, 1u);
            ids.insert(obj.tracking_id);
        }
        EXPECT_EQ(ids.size(), objects.size());
    }
}

TEST_F(MultiObjectTrackerTest, NewTrackNeedsMinHitsMatchesAfterWarmUp) {
    MultiObjectTracker tracker(config_with(30, 3));

    for (int i = 0; i < 3; ++i) {
        tracker.update({});
    }

    const Detection det = make_detection(200, 200, 260, 320);

    // First appearance only seeds the track
    EXPECT_TRUE(tracker.update({det}).empty());

    EXPECT_TRUE(tracker.update({det}).empty());
    EXPECT_TRUE(tracker.update({det}).empty());

    auto objects = tracker.update({det});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
    EXPECT_EQ(objects[0].hit_streak, 3);
}

TEST_F(MultiObjectTrackerTest, UnmatchedSpawnNotEmittedAfterWarmUp) {
    MultiObjectTracker tracker(config_with(30, 1));

    tracker.update({});
    tracker.update({});

    const Detection det = make_detection(10, 10, 60, 110);

    EXPECT_TRUE(tracker.update({det}).empty());
    EXPECT_EQ(tracker.tracks().size(), 1u);

    auto objects = tracker.update({det});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].hit_streak, 1);
}

TEST_F(MultiObjectTrackerTest, ConfirmedTrackCoastsOneFrame) {
    MultiObjectTracker tracker;
    const Detection det = make_detection(100, 100, 150, 200);

    for (int i = 0; i < 5; ++i) {
        tracker.update({det});
    }

    auto objects = tracker.update({});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
    EXPECT_EQ(objects[0].time_since_update, 1);

    EXPECT_TRUE(tracker.update({}).empty());
    EXPECT_EQ(tracker.tracks().size(), 1u);
}

TEST_F(MultiObjectTrackerTest, ReacquiredAfterShortGap) {
    MultiObjectTracker tracker;
    const Detection det = make_detection(100, 100, 150, 200);

    for (int i = 0; i < 5; ++i) tracker.update({det});
    for (int i = 0; i < 3; ++i) tracker.update({});

    // Streak restarts, so the object needs min_hits matches to reappear
    EXPECT_TRUE(tracker.update({det}).empty());
    EXPECT_TRUE(tracker.update({det}).empty());

    auto objects = tracker.update({det});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
    EXPECT_EQ(tracker.stats().tracks_created, 1u);
}

TEST_F(MultiObjectTrackerTest, PrunedAfterMaxAge) {
    MultiObjectTracker tracker(config_with(5, 1));
    const Detection det = make_detection(100, 100, 150, 200);

    tracker.update({det});

    for (int i = 0; i < 5; ++i) {
        tracker.update({});
    }
    EXPECT_EQ(tracker.tracks().size(), 1u);

    tracker.update({});
    EXPECT_TRUE(tracker.tracks().empty());
    EXPECT_EQ(tracker.stats().tracks_pruned, 1u);

    // Ids are not reused
    EXPECT_TRUE(tracker.update({det}).empty());
    ASSERT_EQ(tracker.tracks().size(), 1u);

    auto objects = tracker.update({det});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 2u);
}

TEST_F(MultiObjectTrackerTest, ConfidenceFollowsLastMatch) {
    MultiObjectTracker tracker;

    tracker.update({make_detection(100, 100, 150, 200, 0.7f)});
    auto objects = tracker.update({make_detection(101, 100, 151, 200, 0.4f)});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_FLOAT_EQ(objects[0].confidence, 0.4f);

    objects = tracker.update({});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_FLOAT_EQ(objects[0].confidence, 0.4f);
}

TEST_F(MultiObjectTrackerTest, ConfidenceClamped) {
    MultiObjectTracker tracker;

    auto objects = tracker.update({make_detection(0, 0, 10, 10, 1.7f),
                                   make_detection(50, 50, 60, 60, -0.2f)});
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_FLOAT_EQ(objects[0].confidence, 1.0f);
    EXPECT_FLOAT_EQ(objects[1].confidence, 0.0f);
}

TEST_F(MultiObjectTrackerTest, MalformedDetectionsRejected) {
    MultiObjectTracker tracker;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    auto objects = tracker.update({
        make_detection(nan, 0, 10, 10),
        make_detection(50, 0, 10, 10),          // Inverted
        make_detection(0, 0, 10, 10, inf),
        make_detection(5, 5, 5, 5),              // Zero area is kept
    });

    EXPECT_EQ(tracker.stats().detections_rejected, 3u);
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].bbox, (PixelBox{5, 5, 5, 5}));
}

TEST_F(MultiObjectTrackerTest, OverflowingBoxesDoNotThrow) {
    MultiObjectTracker tracker;
    const Detection huge = make_detection(-1e30f, -1e30f, 1e30f, 1e30f);

    EXPECT_NO_THROW(tracker.update({huge}));
    EXPECT_NO_THROW(tracker.update({huge}));
    EXPECT_NO_THROW(tracker.update({}));
}

TEST_F(MultiObjectTrackerTest, TrackDivergingOnPredictRemoved) {
    // Velocity variance at the edge of double range: the second predict
    // overflows the position covariance
    TrackerConfig tc;
    tc.noise.velocity_uncertainty = 1e308;
    MultiObjectTracker tracker(tc);

    tracker.update({make_detection(100, 100, 150, 200)});

    // Far-away detection spawns a second track; the first coasts once
    tracker.update({make_detection(400, 300, 450, 400)});
    ASSERT_EQ(tracker.tracks().size(), 2u);
    EXPECT_EQ(tracker.stats().tracks_diverged, 0u);

    auto objects = tracker.update({});

    EXPECT_EQ(tracker.stats().tracks_diverged, 1u);
    ASSERT_EQ(tracker.tracks().size(), 1u);
    EXPECT_EQ(tracker.tracks()[0].id(), 1u);

    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 2u);
}

TEST_F(MultiObjectTrackerTest, TrackDivergingOnObserveRemoved) {
    // Innovation covariance overflows to infinity on the first match
    TrackerConfig tc;
    tc.noise.velocity_uncertainty = 1e308;
    tc.noise.measurement_noise = 1.7e308;
    MultiObjectTracker tracker(tc);

    const Detection det = make_detection(100, 100, 150, 200);
    tracker.update({det});

    auto objects = tracker.update({det, make_detection(400, 300, 450, 400)});

    EXPECT_EQ(tracker.stats().tracks_diverged, 1u);
    ASSERT_EQ(tracker.tracks().size(), 1u);
    EXPECT_EQ(tracker.tracks()[0].id(), 1u);

    // The diverged match is not respawned
    EXPECT_EQ(tracker.stats().tracks_created, 2u);
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 2u);
}

TEST_F(MultiObjectTrackerTest, ResetRestartsIds) {
    MultiObjectTracker tracker;

    tracker.update({make_detection(0, 0, 10, 10), make_detection(50, 50, 60, 60)});
    tracker.reset();

    EXPECT_EQ(tracker.frame_count(), 0u);
    EXPECT_TRUE(tracker.tracks().empty());
    EXPECT_EQ(tracker.stats().frames_processed, 1u);

    auto objects = tracker.update({make_detection(200, 200, 210, 210)});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
}

TEST_F(MultiObjectTrackerTest, InstancesAreIndependent) {
    MultiObjectTracker a;
    MultiObjectTracker b;

    a.update({make_detection(0, 0, 10, 10), make_detection(50, 50, 60, 60)});

    EXPECT_TRUE(b.tracks().empty());
    EXPECT_EQ(b.frame_count(), 0u);

    auto objects = b.update({make_detection(0, 0, 10, 10)});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].tracking_id, 1u);
    EXPECT_EQ(a.tracks().size(), 2u);
}

TEST_F(MultiObjectTrackerTest, CustomClassName) {
    TrackerConfig tc;
    tc.class_name = "worker";
    MultiObjectTracker tracker(tc);

    auto objects = tracker.update({make_detection(0, 0, 10, 10)});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].class_name, "worker");
}
