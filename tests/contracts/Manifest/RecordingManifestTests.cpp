// Repository: Seamline
// Component: Recording Manifest Tests
// Purpose: JSON parsing of duration and eventLogs, including the lenient
//          cases the loader relies on.
// Copyright (c) 2025 Seamline Authors

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "seamline/manifest/RecordingManifest.hpp"
#include "seamline/util/Errors.hpp"

namespace seamline::testing {
namespace {

using manifest::RecordingManifest;

TEST(RecordingManifestTest, ParsesDurationAndEvents) {
  auto m = RecordingManifest::FromJson(R"({
    "duration": 12.5,
    "eventLogs": [
      { "relativeTime": 0, "data": { "url": "https://cdn/a.mp4" } },
      { "relativeTime": 3.25, "data": { "url": "https://cdn/b.m4a", "kind": "x" } }
    ]
  })");

  ASSERT_TRUE(m.has_value());
  ASSERT_TRUE(m->duration.has_value());
  EXPECT_DOUBLE_EQ(*m->duration, 12.5);
  ASSERT_EQ(m->events.size(), 2u);
  EXPECT_EQ(m->events[0].url.value_or(""), "https://cdn/a.mp4");
  EXPECT_DOUBLE_EQ(m->events[1].relative_time, 3.25);
  EXPECT_EQ(m->events[1].index, 1u);
  EXPECT_DOUBLE_EQ(m->RequireDuration(), 12.5);
}

TEST(RecordingManifestTest, NumericStringDurationIsAccepted) {
  auto m = RecordingManifest::FromJson(R"({"duration": " 42.0 ", "eventLogs": []})");

  ASSERT_TRUE(m.has_value());
  EXPECT_DOUBLE_EQ(m->RequireDuration(), 42.0);
}

TEST(RecordingManifestTest, MissingDurationThrowsOnRequire) {
  auto m = RecordingManifest::FromJson(R"({"eventLogs": []})");

  ASSERT_TRUE(m.has_value());
  EXPECT_FALSE(m->duration.has_value());
  EXPECT_THROW(m->RequireDuration(), MissingDurationError);
}

TEST(RecordingManifestTest, NonPositiveOrGarbageDurationIsMissing) {
  for (const char* json : {R"({"duration": 0})", R"({"duration": -3})",
                           R"({"duration": "abc"})", R"({"duration": null})",
                           R"({"duration": {}})"}) {
    auto m = RecordingManifest::FromJson(json);
    ASSERT_TRUE(m.has_value()) << json;
    EXPECT_FALSE(m->duration.has_value()) << json;
  }
}

TEST(RecordingManifestTest, EventsWithoutUrlKeepTheirSlot) {
  auto m = RecordingManifest::FromJson(R"({
    "duration": 5,
    "eventLogs": [
      { "relativeTime": 1, "data": {} },
      { "relativeTime": 2, "data": { "url": "" } },
      { "relativeTime": 3, "data": { "url": 17 } }
    ]
  })");

  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->events.size(), 3u);
  for (const auto& e : m->events) {
    EXPECT_FALSE(e.url.has_value());
  }
}

TEST(RecordingManifestTest, EventsWithoutDataObjectAreDropped) {
  auto m = RecordingManifest::FromJson(R"({
    "duration": 5,
    "eventLogs": [ 7, { "relativeTime": 1 }, { "data": "x" },
                   { "data": { "url": "u" } } ]
  })");

  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->events.size(), 1u);
  EXPECT_EQ(m->events[0].index, 3u);
  EXPECT_DOUBLE_EQ(m->events[0].relative_time, 0.0);
}

TEST(RecordingManifestTest, RelativeTimeVariants) {
  auto m = RecordingManifest::FromJson(R"({
    "duration": 5,
    "eventLogs": [
      { "relativeTime": "1.5", "data": { "url": "a" } },
      { "relativeTime": null, "data": { "url": "b" } },
      { "relativeTime": "soon", "data": { "url": "c" } },
      { "relativeTime": -2, "data": { "url": "d" } }
    ]
  })");

  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->events.size(), 4u);
  EXPECT_DOUBLE_EQ(m->events[0].relative_time, 1.5);
  EXPECT_FALSE(m->events[0].relative_time_invalid);
  EXPECT_DOUBLE_EQ(m->events[1].relative_time, 0.0);
  EXPECT_FALSE(m->events[1].relative_time_invalid);
  EXPECT_TRUE(m->events[2].relative_time_invalid);
  // Clamping is the loader's job.
  EXPECT_DOUBLE_EQ(m->events[3].relative_time, -2.0);
}

TEST(RecordingManifestTest, EscapedUrlIsDecoded) {
  auto m = RecordingManifest::FromJson(
      R"({"duration": 1, "eventLogs": [{"data": {"url": "https:\/\/cdn\/a bA.mp4"}}]})");

  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->events.size(), 1u);
  EXPECT_EQ(m->events[0].url.value_or(""), "https://cdn/a bA.mp4");
}

TEST(RecordingManifestTest, MalformedJsonIsRejected) {
  EXPECT_FALSE(RecordingManifest::FromJson("").has_value());
  EXPECT_FALSE(RecordingManifest::FromJson("[]").has_value());
  EXPECT_FALSE(RecordingManifest::FromJson(R"({"duration": 5)").has_value());
  EXPECT_FALSE(RecordingManifest::FromJson(R"({"duration" 5})").has_value());
}

TEST(RecordingManifestTest, FromFileReadsAndRejectsMissing) {
  const auto path = std::filesystem::temp_directory_path() / "seamline_manifest_test.json";
  std::ofstream(path) << R"({"duration": 9, "eventLogs": []})";

  auto m = RecordingManifest::FromFile(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(m.has_value());
  EXPECT_DOUBLE_EQ(m->RequireDuration(), 9.0);
  EXPECT_FALSE(RecordingManifest::FromFile("/nonexistent/seamline.json").has_value());
}

}  // namespace
}  // namespace seamline::testing
