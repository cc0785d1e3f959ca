#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "rigtrace/interp/errors.hpp"
#include "rigtrace/interp/log_types.hpp"
#include "rigtrace/interp/type_registry.hpp"
#include "rigtrace/io/classifier.hpp"
#include "rigtrace/io/decoder.hpp"
#include "rigtrace/io/log_file.hpp"
#include "test_files.hpp"

namespace {

// Accepts files whose name contains a fragment, counting how often it is asked.
class FragmentClassifier : public rigtrace::io::LogClassifier {
 public:
  FragmentClassifier(std::string fragment, rigtrace::io::ProbeCost cost) : fragment_(std::move(fragment)), cost_(cost) {}

  std::string name() const override { return fragment_; }
  rigtrace::io::ProbeCost cost() const override { return cost_; }
  int probes() const { return probes_; }

 protected:
  rigtrace::io::ProbeVerdict Probe(rigtrace::io::LogFile& file) const override {
    ++probes_;
    if (file.filename().find(fragment_) == std::string::npos) {
      return {false, "fragment '" + fragment_ + "' not in name"};
    }
    return {true, {}};
  }

 private:
  std::string fragment_;
  rigtrace::io::ProbeCost cost_;
  mutable std::atomic<int> probes_{0};
};

class EmptyDecoder : public rigtrace::io::Decoder {
 public:
  rigtrace::io::DecodedLog Parse(const std::filesystem::path&) const override { return {}; }
};

std::shared_ptr<FragmentClassifier> Fragment(std::string fragment,
                                             rigtrace::io::ProbeCost cost = rigtrace::io::ProbeCost::kName) {
  return std::make_shared<FragmentClassifier>(std::move(fragment), cost);
}

}  // namespace

TEST(TypeRegistryTest, DuplicateTagIsFatal) {
  rigtrace::interp::TypeRegistry registry;
  const auto decoder = std::make_shared<EmptyDecoder>();
  registry.Register("pump", Fragment("pump"), decoder);

  try {
    registry.Register("pump", Fragment("other"), decoder);
    FAIL() << "expected DuplicateTagError";
  } catch (const rigtrace::interp::DuplicateTagError& ex) {
    EXPECT_EQ(ex.tag(), "pump");
  }
  EXPECT_EQ(registry.size(), 1);
}

TEST(TypeRegistryTest, RejectsIncompleteRegistrations) {
  rigtrace::interp::TypeRegistry registry;
  const auto decoder = std::make_shared<EmptyDecoder>();

  EXPECT_THROW(registry.Register("", Fragment("a"), decoder), rigtrace::interp::RegistryError);
  EXPECT_THROW(registry.Register("a", nullptr, decoder), rigtrace::interp::RegistryError);
  EXPECT_THROW(registry.Register("a", Fragment("a"), nullptr), rigtrace::interp::RegistryError);
  EXPECT_TRUE(registry.empty());
  EXPECT_THROW(registry.at("a"), rigtrace::interp::RegistryError);
  EXPECT_EQ(registry.Find("a"), nullptr);
}

TEST(TypeRegistryTest, CheaperProbesWinFirstMatch) {
  rigtrace::interp::TypeRegistry registry;
  const auto decoder = std::make_shared<EmptyDecoder>();
  registry.Register("by_header", Fragment("trial", rigtrace::io::ProbeCost::kHeader), decoder);
  registry.Register("by_name", Fragment("trial", rigtrace::io::ProbeCost::kName), decoder);
  registry.Register("by_name_late", Fragment("trial", rigtrace::io::ProbeCost::kName), decoder);

  EXPECT_EQ(registry.tags(), (std::vector<std::string>{"by_name", "by_name_late", "by_header"}));
  EXPECT_EQ(registry.Classify(std::filesystem::path("trial.csv")), "by_name");
  EXPECT_FALSE(registry.Classify(std::filesystem::path("other.csv")).has_value());
  EXPECT_EQ(registry.at("by_header")->registration_index, 0);
}

TEST(TypeRegistryTest, ClassifyAllReportsEveryMatchAndRejection) {
  rigtrace::interp::TypeRegistry registry;
  const auto decoder = std::make_shared<EmptyDecoder>();
  registry.Register("pump", Fragment("pump"), decoder);
  registry.Register("picopump", Fragment("picopump"), decoder);
  registry.Register("fictrac", Fragment("fictrac"), decoder);

  std::vector<std::string> rejections;
  const auto tags = registry.ClassifyAll(std::filesystem::path("picopump_0.csv"), &rejections);

  EXPECT_EQ(tags, (std::set<std::string>{"picopump", "pump"}));
  ASSERT_EQ(rejections.size(), 1);
  EXPECT_EQ(rejections[0], "fictrac: fragment 'fictrac' not in name");
}

TEST(TypeRegistryTest, ReusesVerdictsForTheSameFile) {
  rigtrace::interp::TypeRegistry registry;
  const auto classifier = Fragment("pump");
  registry.Register("pump", classifier, std::make_shared<EmptyDecoder>());

  rigtrace::io::LogFile file("pump.csv");
  EXPECT_EQ(registry.ClassifyAll(file).size(), 1);
  EXPECT_EQ(registry.Classify(file), "pump");
  EXPECT_EQ(classifier->probes(), 1);
}

TEST(TypeRegistryTest, BuiltinTypesClassifySampleSession) {
  rigtrace::interp::TypeRegistry registry;
  rigtrace::interp::RegisterBuiltinLogTypes(registry);
  const auto sample = rigtrace::testing::SampleDataDir() / "session_sample";

  EXPECT_EQ(registry.Classify(sample / "fictrac_trial.csv"), rigtrace::interp::kFicTracTag);
  EXPECT_EQ(registry.Classify(sample / "warner_temp_read.csv"), rigtrace::interp::kWarnerTemperatureTag);
  EXPECT_FALSE(registry.Classify(sample / "notes.txt").has_value());
  EXPECT_EQ(registry.ClassifyAll(sample / "fictrac_trial.csv").size(), 1);

  EXPECT_THROW(rigtrace::interp::RegisterBuiltinLogTypes(registry), rigtrace::interp::DuplicateTagError);
}
