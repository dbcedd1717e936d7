#include "DateCli.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace plaindate::cli {
namespace {

struct CliResult {
  int code = 0;
  std::string out;
  std::string err;
};

// 2024-01-01T00:00:00Z
Instant FixedNow() {
  return Instant(std::chrono::seconds(1704067200));
}

CliResult RunCli(std::initializer_list<std::string_view> argv) {
  const std::vector<std::string_view> args(argv);
  std::ostringstream out, err;
  CliResult r;
  r.code = run(args, out, err, FixedNow);
  r.out = out.str();
  r.err = err.str();
  return r;
}

TEST(DateCliTest, HelpWithoutArguments) {
  const CliResult r = RunCli({});
  EXPECT_EQ(r.code, 0);
  EXPECT_NE(r.out.find("Usage:"), std::string::npos);
}

TEST(DateCliTest, HelpFlags) {
  EXPECT_EQ(RunCli({"--help"}).code, 0);
  EXPECT_EQ(RunCli({"-h"}).code, 0);
}

TEST(DateCliTest, UnknownCommand) {
  const CliResult r = RunCli({"frobnicate"});
  EXPECT_EQ(r.code, 2);
  EXPECT_NE(r.err.find("Unknown command: frobnicate"), std::string::npos);
  EXPECT_TRUE(r.out.empty());
}

TEST(DateCliTest, TodayUtc) {
  const CliResult r = RunCli({"today", "--utc"});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, "2024-01-01\n");
}

TEST(DateCliTest, TodayLocalFollowsZone) {
  const char* saved = std::getenv("TZ");
  const std::string restore = saved ? saved : "";
  setenv("TZ", "EST5EDT,M3.2.0,M11.1.0", 1);
  tzset();

  const CliResult r = RunCli({"today"});

  if (saved) setenv("TZ", restore.c_str(), 1); else unsetenv("TZ");
  tzset();

  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, "2023-12-31\n");
}

TEST(DateCliTest, TodayRejectsUnknownFlag) {
  EXPECT_EQ(RunCli({"today", "--local"}).code, 1);
  EXPECT_EQ(RunCli({"today", "--utc", "x"}).code, 1);
}

TEST(DateCliTest, Valid) {
  const CliResult r = RunCli({"valid", "2024-02-29"});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, "valid\n");
}

TEST(DateCliTest, InvalidReportsReason) {
  const CliResult r = RunCli({"valid", "2025-02-29"});
  EXPECT_EQ(r.code, 2);
  EXPECT_EQ(r.out, "invalid: Expression '2025-02-29' is not a valid date\n");

  const CliResult m = RunCli({"valid", "2125-NOV-29"});
  EXPECT_EQ(m.code, 2);
  EXPECT_EQ(m.out, "invalid: Expression 'NOV' in '2125-NOV-29' is not valid\n");
}

TEST(DateCliTest, AddAndSub) {
  EXPECT_EQ(RunCli({"add", "2024-02-15", "14"}).out, "2024-02-29\n");
  EXPECT_EQ(RunCli({"add", "2024-02-15", "15"}).out, "2024-03-01\n");
  EXPECT_EQ(RunCli({"add", "2024-02-15", "-3"}).out, "2024-02-12\n");
  EXPECT_EQ(RunCli({"sub", "2024-01-03", "7"}).out, "2023-12-27\n");
  EXPECT_EQ(RunCli({"sub", "2024-02-15", "-3"}).out, "2024-02-18\n");
}

TEST(DateCliTest, AddRejectsBadInput) {
  const CliResult badDate = RunCli({"add", "2024-11-31", "1"});
  EXPECT_EQ(badDate.code, 2);
  EXPECT_EQ(badDate.err, "[plaindate] Expression '2024-11-31' is not a valid date\n");

  const CliResult badCount = RunCli({"add", "2024-11-30", "1.5"});
  EXPECT_EQ(badCount.code, 2);
  EXPECT_EQ(badCount.err, "[plaindate] Invalid day count: 1.5\n");

  EXPECT_EQ(RunCli({"add", "2024-11-30"}).code, 1);
}

TEST(DateCliTest, Diff) {
  EXPECT_EQ(RunCli({"diff", "2023-02-15", "2025-03-05"}).out, "749\n");
  EXPECT_EQ(RunCli({"diff", "2024-02-15", "2024-01-15"}).out, "-31\n");
  EXPECT_EQ(RunCli({"diff", "1-01-01", "6000000-01-01"}).out, "2191454634\n");
  EXPECT_EQ(RunCli({"diff", "2024-02-15", "nope"}).code, 2);
}

TEST(DateCliTest, Weekday) {
  EXPECT_EQ(RunCli({"weekday", "1970-01-01"}).out, "Thursday\n");
  EXPECT_EQ(RunCli({"weekday", "2025-01-19"}).out, "Sunday\n");
}

TEST(DateCliTest, Between) {
  EXPECT_EQ(RunCli({"between", "2024-02-15", "2024-02-16", "2024-02-15"}).out, "yes\n");
  EXPECT_EQ(RunCli({"between", "2024-02-15", "2024-03-15", "2024-04-15"}).out, "no\n");
  EXPECT_EQ(RunCli({"between", "2024-02-15", "2024-03-15"}).code, 1);
}

TEST(DateCliTest, Leap) {
  EXPECT_EQ(RunCli({"leap", "2000"}).out, "yes\n");
  EXPECT_EQ(RunCli({"leap", "1900"}).out, "no\n");
  const CliResult r = RunCli({"leap", "MMXXIV"});
  EXPECT_EQ(r.code, 2);
  EXPECT_EQ(r.err, "[plaindate] Invalid year: MMXXIV\n");
}

}  // namespace
}  // namespace plaindate::cli
