#include <gtest/gtest.h>

#include "ptrack/io/detection_log.hpp"
#include "ptrack/core/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace ptrack;

class DetectionLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("", LogLevel::OFF, LogLevel::OFF);
    }
};

TEST_F(DetectionLogTest, ParsesFrames) {
    auto log = parse_detection_log(R"(
frames:
  - detections:
      - bbox: [10, 20, 60, 120]
        confidence: 0.91
      - bbox: [200.5, 40, 250, 160]
        confidence: 0.55
  - detections: []
  - detections:
      - bbox: [12, 20, 62, 120]
)");

    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log->frames.size(), 3u);
    EXPECT_EQ(log->total_detections(), 3u);

    const auto& first = log->frames[0];
    ASSERT_EQ(first.size(), 2u);
    EXPECT_FLOAT_EQ(first[0].bbox.x1, 10.0f);
    EXPECT_FLOAT_EQ(first[0].bbox.y2, 120.0f);
    EXPECT_FLOAT_EQ(first[0].confidence, 0.91f);
    EXPECT_FLOAT_EQ(first[1].bbox.x1, 200.5f);

    EXPECT_TRUE(log->frames[1].empty());

    // Missing confidence defaults to 1
    ASSERT_EQ(log->frames[2].size(), 1u);
    EXPECT_FLOAT_EQ(log->frames[2][0].confidence, 1.0f);
}

TEST_F(DetectionLogTest, FrameWithoutDetectionsKeyIsEmpty) {
    auto log = parse_detection_log(R"(
frames:
  - {}
  - detections:
      - bbox: [0, 0, 5, 5]
)");

    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log->frames.size(), 2u);
    EXPECT_TRUE(log->frames[0].empty());
    EXPECT_EQ(log->frames[1].size(), 1u);
}

TEST_F(DetectionLogTest, ReadsClassLabel) {
    auto log = parse_detection_log(R"(
frames:
  - detections:
      - bbox: [0, 0, 5, 5]
        class: cyclist
)");

    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log->frames[0].size(), 1u);
    EXPECT_EQ(log->frames[0][0].class_name, "cyclist");
}

TEST_F(DetectionLogTest, SkipsBadEntries) {
    auto log = parse_detection_log(R"(
frames:
  - detections:
      - bbox: [0, 0, 5]
      - bbox: [0, 0, a, 5]
      - confidence: 0.4
      - bbox: [1, 1, 9, 9]
        confidence: 0.8
)");

    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log->frames[0].size(), 1u);
    EXPECT_FLOAT_EQ(log->frames[0][0].bbox.x2, 9.0f);
}

TEST_F(DetectionLogTest, MissingFramesRejected) {
    EXPECT_FALSE(parse_detection_log("detections: []\n").has_value());
    EXPECT_FALSE(parse_detection_log("frames: 3\n").has_value());
}

TEST_F(DetectionLogTest, InvalidYamlRejected) {
    EXPECT_FALSE(parse_detection_log("frames: [\n").has_value());
}

TEST_F(DetectionLogTest, LoadFromFile) {
    const fs::path dir = fs::temp_directory_path() / "ptrack_detection_log_test";
    fs::create_directories(dir);
    const fs::path path = dir / "detections.yaml";

    {
        std::ofstream f(path);
        f << "frames:\n"
          << "  - detections:\n"
          << "      - bbox: [1, 2, 3, 4]\n"
          << "        confidence: 0.5\n";
    }

    auto log = load_detection_log(path.string());
    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log->frames.size(), 1u);
    EXPECT_FLOAT_EQ(log->frames[0][0].bbox.y1, 2.0f);

    fs::remove_all(dir);
}

TEST_F(DetectionLogTest, MissingFileRejected) {
    EXPECT_FALSE(load_detection_log("/nonexistent/detections.yaml").has_value());
}
