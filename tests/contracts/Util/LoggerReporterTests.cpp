// Repository: Seamline
// Component: Logger / Reporter Tests
// Purpose: Level routing of LoggerReporter through the Logger test sinks.
// Copyright (c) 2025 Seamline Authors

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seamline/util/Errors.hpp"
#include "seamline/util/Logger.hpp"
#include "seamline/util/Reporter.hpp"

namespace seamline::testing {
namespace {

using util::Logger;
using util::ReportCode;

class LoggerReporterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetInfoSink([this](const std::string& l) { info_.push_back(l); });
    Logger::SetWarnSink([this](const std::string& l) { warn_.push_back(l); });
    Logger::SetErrorSink([this](const std::string& l) { error_.push_back(l); });
  }

  void TearDown() override {
    Logger::SetInfoSink(nullptr);
    Logger::SetWarnSink(nullptr);
    Logger::SetErrorSink(nullptr);
    Logger::SetDebugEnabled(false);
  }

  std::vector<std::string> info_;
  std::vector<std::string> warn_;
  std::vector<std::string> error_;
};

TEST_F(LoggerReporterTest, RoutesEachLevelWithComponentPrefix) {
  util::LoggerReporter reporter;

  reporter.Info(ReportCode::kTotalDuration, "FragmentLoader", "Total duration of clips: 3");
  reporter.Warn(ReportCode::kFragmentFetchFailed, "FragmentLoader", "Failed to download: u");
  reporter.Error(ReportCode::kCompileFailed, "Compiler", "boom");

  ASSERT_EQ(info_.size(), 1u);
  EXPECT_EQ(info_[0], "[FragmentLoader] Total duration of clips: 3");
  ASSERT_EQ(warn_.size(), 1u);
  EXPECT_EQ(warn_[0], "[FragmentLoader] Failed to download: u");
  ASSERT_EQ(error_.size(), 1u);
  EXPECT_EQ(error_[0], "[Compiler] boom");
}

TEST_F(LoggerReporterTest, DebugNeverReachesOtherSinks) {
  util::LoggerReporter reporter;
  Logger::SetDebugEnabled(true);
  EXPECT_TRUE(Logger::IsDebugEnabled());

  reporter.Debug(ReportCode::kFragmentLoaded, "FragmentLoader", "loaded");

  EXPECT_TRUE(info_.empty());
  EXPECT_TRUE(warn_.empty());
  EXPECT_TRUE(error_.empty());
}

TEST_F(LoggerReporterTest, NullReporterDropsEverything) {
  util::NullReporter reporter;

  reporter.Error(ReportCode::kCompileFailed, "Compiler", "ignored");

  EXPECT_TRUE(error_.empty());
}

TEST(ReportCodeTest, NamesAreStable) {
  EXPECT_STREQ(util::ReportCodeName(ReportCode::kFragmentFetchFailed), "FRAGMENT_FETCH_FAILED");
  EXPECT_STREQ(util::ReportCodeName(ReportCode::kDurationCapped), "DURATION_CAPPED");
  EXPECT_STREQ(util::ReportLevelName(util::ReportLevel::kWarn), "warn");
}

TEST(ErrorsTest, MessagesCarryTheirPrefix) {
  MissingDurationError missing("no field");
  EXPECT_STREQ(missing.what(), "Duration not found in recording manifest: no field");

  CompileError failed("disk full");
  EXPECT_EQ(failed.cause(), "disk full");
  EXPECT_STREQ(failed.what(), "Failed to compile final video: disk full");
}

}  // namespace
}  // namespace seamline::testing
