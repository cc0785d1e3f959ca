#include <string>

#include <gtest/gtest.h>

#include "rigtrace/io/classifier.hpp"
#include "rigtrace/io/log_file.hpp"
#include "test_files.hpp"

using rigtrace::io::LogSignature;
using rigtrace::io::ProbeCost;
using rigtrace::io::SignatureClassifier;
using rigtrace::testing::ScopedTempDir;
using rigtrace::testing::WriteTextFile;

TEST(ClassifierTest, CostFollowsTheDeepestCheck) {
  EXPECT_EQ(SignatureClassifier("a", {".csv", {"pump"}, {}, {}}).cost(), ProbeCost::kName);
  EXPECT_EQ(SignatureClassifier("b", {{}, {}, "PK", {}}).cost(), ProbeCost::kMagic);
  EXPECT_EQ(SignatureClassifier("c", {".csv", {}, {}, {"timestamp"}}).cost(), ProbeCost::kHeader);
}

TEST(ClassifierTest, MatchesExtensionNameAndColumns) {
  const ScopedTempDir dir;
  const auto path = WriteTextFile(dir.path() / "Warner_Read.CSV", "timestamp,frame_id,temperature\n1,a,2\n");

  const SignatureClassifier classifier("Warner", {".csv", {"Read"}, {}, {"timestamp", "temperature"}});
  EXPECT_TRUE(classifier.IsValid(path, false));
}

TEST(ClassifierTest, ReportsWhyAFileIsRejected) {
  const ScopedTempDir dir;
  const auto path = WriteTextFile(dir.path() / "trial.csv", "timestamp,speed\n1,2\n");

  const SignatureClassifier classifier("FicTrac", {".csv", {}, {}, {"timestamp", "frame_counter", "heading"}});
  std::string reason;
  EXPECT_FALSE(classifier.IsValid(path, true, &reason));
  EXPECT_NE(reason.find("frame_counter, heading"), std::string::npos);

  const SignatureClassifier named("Pump", {".csv", {"picopump"}, {}, {}});
  EXPECT_FALSE(named.IsValid(path, false, &reason));
  EXPECT_NE(reason.find("picopump"), std::string::npos);

  const SignatureClassifier json("Metadata", {".json", {}, {}, {}});
  EXPECT_FALSE(json.IsValid(path, false, &reason));
  EXPECT_NE(reason.find("extension"), std::string::npos);
}

TEST(ClassifierTest, UnreadableFileIsANegativeVerdict) {
  const ScopedTempDir dir;
  rigtrace::io::LogFile file(dir.path() / "missing.csv");

  const SignatureClassifier classifier("Any", {".csv", {}, {}, {"timestamp"}});
  const rigtrace::io::ProbeVerdict verdict = classifier.Evaluate(file);
  EXPECT_FALSE(verdict.valid);
  EXPECT_NE(verdict.reason.find("probe failed"), std::string::npos);
}

TEST(ClassifierTest, LogFileStripsByteOrderMarkFromHeader) {
  const ScopedTempDir dir;
  const auto path = WriteTextFile(dir.path() / "bom.csv", "\xEF\xBB\xBFtimestamp,value\r\n1,2\r\n");

  rigtrace::io::LogFile file(path);
  ASSERT_EQ(file.HeaderColumns().size(), 2);
  EXPECT_EQ(file.HeaderColumns()[0], "timestamp");
  EXPECT_EQ(file.HeaderColumns()[1], "value");
  EXPECT_EQ(file.extension(), ".csv");
}

TEST(ClassifierTest, HeaderIsFirstNonBlankLine) {
  const ScopedTempDir dir;
  const auto path = WriteTextFile(dir.path() / "padded.csv", "\n\r\n\ntimestamp,value\n1,2\n");

  rigtrace::io::LogFile file(path);
  ASSERT_EQ(file.HeaderColumns().size(), 2);
  EXPECT_EQ(file.HeaderColumns()[0], "timestamp");
  EXPECT_EQ(file.HeaderColumns()[1], "value");

  const SignatureClassifier classifier("Padded", {".csv", {}, {}, {"timestamp", "value"}});
  EXPECT_TRUE(classifier.IsValid(path, false));
}
