#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "rigtrace/interp/errors.hpp"
#include "rigtrace/interp/log_types.hpp"
#include "rigtrace/interp/type_registry.hpp"
#include "rigtrace/io/classifier.hpp"
#include "rigtrace/io/decoder.hpp"
#include "rigtrace/io/errors.hpp"
#include "rigtrace/session/experiment.hpp"
#include "test_files.hpp"

using rigtrace::interp::Facet;
using rigtrace::session::DiagnosticKind;
using rigtrace::session::Experiment;
using rigtrace::session::FileDiagnostic;
using rigtrace::session::ScanOptions;
using rigtrace::testing::CopySample;
using rigtrace::testing::ScopedTempDir;
using rigtrace::testing::WriteTextFile;

namespace {

const std::filesystem::path kSample = rigtrace::testing::SampleDataDir() / "session_sample";

std::shared_ptr<const rigtrace::interp::TypeRegistry> BuiltinRegistry() {
  auto registry = std::make_shared<rigtrace::interp::TypeRegistry>();
  rigtrace::interp::RegisterBuiltinLogTypes(*registry);
  return registry;
}

std::vector<std::string> Filenames(const Experiment::InterpreterList& interpreters) {
  std::vector<std::string> names;
  for (const auto* interpreter : interpreters) {
    names.push_back(interpreter->source_path().filename().string());
  }
  return names;
}

std::vector<std::string> Filenames(const std::vector<FileDiagnostic>& diagnostics) {
  std::vector<std::string> names;
  for (const auto& diagnostic : diagnostics) {
    names.push_back(diagnostic.path.filename().string());
  }
  return names;
}

// Two recording sessions, each with its own companions.
void WriteTwoSessions(const std::filesystem::path& root) {
  for (const char* session : {"session_a", "session_b"}) {
    CopySample("fictrac_trial.csv", root / session);
    CopySample("warner_temp_read.csv", root / session);
    CopySample("config.yaml", root / session);
    CopySample("rig_git_state.yaml", root / session);
  }
  WriteTextFile(root / "session_b" / "camera.avi", "RIFF....AVI ");
}

// Raises the cancel flag while the scan is decoding, then rejects the file.
class CancellingDecoder : public rigtrace::io::Decoder {
 public:
  explicit CancellingDecoder(std::atomic<bool>* cancel) : cancel_(cancel) {}

  rigtrace::io::DecodedLog Parse(const std::filesystem::path& path) const override {
    cancel_->store(true);
    throw rigtrace::io::CorruptLogError(path.string(), 0, 1, "cancelled while decoding");
  }

 private:
  std::atomic<bool>* cancel_;
};

}  // namespace

TEST(ExperimentTest, ScansSampleSession) {
  const Experiment experiment = Experiment::Scan(kSample, BuiltinRegistry());

  EXPECT_EQ(Filenames(experiment.interpreters()),
            (std::vector<std::string>{"fictrac_trial.csv", "warner_temp_read.csv"}));
  EXPECT_EQ(Filenames(experiment.unclassified()),
            (std::vector<std::string>{"config.yaml", "notes.txt", "rig_git_state.yaml"}));
  EXPECT_TRUE(experiment.ambiguous().empty());
  EXPECT_TRUE(experiment.errored().empty());
  EXPECT_EQ(experiment.scanned_file_count(), 5);
  EXPECT_FALSE(experiment.is_partial());
  EXPECT_FALSE(experiment.probed_adjacent());

  EXPECT_EQ(experiment.tags(), (std::vector<std::string>{"fictrac", "warner_temperature"}));
  ASSERT_EQ(experiment.ForTag(rigtrace::interp::kFicTracTag).size(), 1);
  EXPECT_TRUE(experiment.ForTag(rigtrace::interp::kPicoPumpTag).empty());
  EXPECT_EQ(experiment.First(rigtrace::interp::kPicoPumpTag), nullptr);
  ASSERT_EQ(experiment.sessions().size(), 1);
  EXPECT_EQ(experiment.sessions().begin()->first, ".");

  const auto* warner = experiment.First(rigtrace::interp::kWarnerTemperatureTag);
  ASSERT_NE(warner, nullptr);
  EXPECT_TRUE(warner->Has(Facet::kConfigProvenance));
  EXPECT_FALSE(warner->version_provenance().compatible());
}

TEST(ExperimentTest, AlignsTimeBasesToEarliestStart) {
  const Experiment experiment = Experiment::Scan(kSample, BuiltinRegistry());

  EXPECT_EQ(experiment.alignment_epoch_ns(), 1500000000);
  const auto* fictrac = experiment.First(rigtrace::interp::kFicTracTag);
  const auto* warner = experiment.First(rigtrace::interp::kWarnerTemperatureTag);
  EXPECT_EQ(fictrac->alignment_offset_ns(), 500000000);
  EXPECT_EQ(warner->alignment_offset_ns(), 0);
  EXPECT_EQ(warner->AlignedTimestamps().front(), 0);

  ScanOptions options;
  options.align_time_bases = false;
  const Experiment unaligned = Experiment::Scan(kSample, BuiltinRegistry(), options);
  EXPECT_FALSE(unaligned.alignment_epoch_ns().has_value());
  EXPECT_EQ(unaligned.First(rigtrace::interp::kFicTracTag)->AlignedTimestamps().front(), 2000000000);
}

TEST(ExperimentTest, ReportsAmbiguousAndCorruptFiles) {
  const ScopedTempDir dir;
  CopySample("fictrac_trial.csv", dir.path());
  WriteTextFile(dir.path() / "light_sugar_driver_picopump.csv",
                "timestamp,picopump_0,sugar_feed_active\n"
                "100,0.5,False\n");
  WriteTextFile(dir.path() / "warner_temp_read.csv",
                "timestamp,frame_id,Temperature (C)_0_channel_idx,Temperature (C)_0_voltage\n"
                "1000,warner,0,24.5\n"
                "2000,warner\n");

  const Experiment experiment = Experiment::Scan(dir.path(), BuiltinRegistry());

  EXPECT_EQ(Filenames(experiment.interpreters()), (std::vector<std::string>{"fictrac_trial.csv"}));

  const auto ambiguous = experiment.ambiguous();
  ASSERT_EQ(ambiguous.size(), 1);
  EXPECT_EQ(ambiguous[0].path.filename().string(), "light_sugar_driver_picopump.csv");
  EXPECT_EQ(ambiguous[0].candidates, (std::vector<std::string>{"light_sugar", "picopump"}));

  const auto errored = experiment.errored();
  ASSERT_EQ(errored.size(), 1);
  EXPECT_EQ(errored[0].kind, DiagnosticKind::kCorruptLog);
  EXPECT_EQ(errored[0].candidates, (std::vector<std::string>{"warner_temperature"}));
  EXPECT_NE(errored[0].reason.find("expected 4 fields"), std::string::npos);
}

TEST(ExperimentTest, FirstMatchWinsWithoutAmbiguityDetection) {
  const ScopedTempDir dir;
  WriteTextFile(dir.path() / "light_sugar_driver_picopump.csv",
                "timestamp,picopump_0,sugar_feed_active\n"
                "100,0.5,False\n");

  ScanOptions options;
  options.detect_ambiguity = false;
  const Experiment experiment = Experiment::Scan(dir.path(), BuiltinRegistry(), options);

  ASSERT_EQ(experiment.interpreters().size(), 1);
  EXPECT_EQ(experiment.interpreters().front()->tag(), rigtrace::interp::kLightSugarTag);
  EXPECT_TRUE(experiment.ambiguous().empty());
}

TEST(ExperimentTest, ResultDoesNotDependOnWorkerCount) {
  const ScopedTempDir dir;
  WriteTwoSessions(dir.path());

  ScanOptions serial;
  serial.workers = 1;
  ScanOptions parallel;
  parallel.workers = 8;

  const Experiment first = Experiment::Scan(dir.path(), BuiltinRegistry(), serial);
  const Experiment second = Experiment::Scan(dir.path(), BuiltinRegistry(), parallel);

  ASSERT_EQ(first.interpreters().size(), 4);
  EXPECT_EQ(Filenames(first.interpreters()), Filenames(second.interpreters()));
  for (std::size_t i = 0; i < first.interpreters().size(); ++i) {
    EXPECT_EQ(first.interpreters()[i]->source_path().string(), second.interpreters()[i]->source_path().string());
    EXPECT_EQ(first.interpreters()[i]->records(), second.interpreters()[i]->records());
  }
  EXPECT_EQ(Filenames(first.diagnostics()), Filenames(second.diagnostics()));
  EXPECT_EQ(first.alignment_epoch_ns(), second.alignment_epoch_ns());
}

TEST(ExperimentTest, GroupsLogsBySessionDirectory) {
  const ScopedTempDir dir;
  WriteTwoSessions(dir.path());

  const Experiment experiment = Experiment::Scan(dir.path(), BuiltinRegistry());

  ASSERT_EQ(experiment.sessions().size(), 2);
  EXPECT_EQ(Filenames(experiment.sessions().at("session_a")),
            (std::vector<std::string>{"fictrac_trial.csv", "warner_temp_read.csv"}));
  EXPECT_EQ(experiment.sessions().at("session_b").size(), 2);
  EXPECT_EQ(experiment.ForTag(rigtrace::interp::kFicTracTag).size(), 2);
  EXPECT_EQ(Filenames(experiment.unclassified()).front(), "config.yaml");
}

TEST(ExperimentTest, CancelledScanIsPartial) {
  const ScopedTempDir dir;
  WriteTwoSessions(dir.path());

  const std::atomic<bool> cancel{true};
  ScanOptions options;
  options.cancel = &cancel;
  const Experiment cancelled = Experiment::Scan(dir.path(), BuiltinRegistry(), options);

  EXPECT_TRUE(cancelled.is_partial());
  EXPECT_TRUE(cancelled.interpreters().empty());
  EXPECT_EQ(cancelled.scanned_file_count(), 0);

  const Experiment rescanned = cancelled.Rescan();
  EXPECT_FALSE(rescanned.is_partial());
  EXPECT_EQ(rescanned.interpreters().size(), 4);
}

TEST(ExperimentTest, ProbesAdjacentFilesWhenRootHasNoLogs) {
  const ScopedTempDir dir;
  CopySample("fictrac_trial.csv", dir.path());
  CopySample("warner_temp_read.csv", dir.path() / "temperature");
  WriteTextFile(dir.path() / "trial" / "notes.txt", "empty trial\n");

  const Experiment experiment = Experiment::Scan(dir.path() / "trial", BuiltinRegistry());

  EXPECT_TRUE(experiment.probed_adjacent());
  EXPECT_EQ(Filenames(experiment.interpreters()),
            (std::vector<std::string>{"fictrac_trial.csv", "warner_temp_read.csv"}));
  EXPECT_EQ(Filenames(experiment.unclassified()), (std::vector<std::string>{"notes.txt"}));
  EXPECT_EQ(experiment.sessions().at(".").size(), 1);
  EXPECT_EQ(experiment.sessions().at("temperature").size(), 1);

  ScanOptions options;
  options.probe_adjacent = false;
  const Experiment inside_only = Experiment::Scan(dir.path() / "trial", BuiltinRegistry(), options);
  EXPECT_FALSE(inside_only.probed_adjacent());
  EXPECT_TRUE(inside_only.interpreters().empty());
}

TEST(ExperimentTest, FileRootScansItsDirectory) {
  const Experiment experiment = Experiment::Scan(kSample / "notes.txt", BuiltinRegistry());

  EXPECT_EQ(experiment.root().string(), std::filesystem::canonical(kSample).string());
  EXPECT_EQ(experiment.interpreters().size(), 2);
}

TEST(ExperimentTest, RefusesUnusableInputs) {
  EXPECT_THROW(Experiment::Scan(kSample, nullptr), rigtrace::interp::RegistryError);
  EXPECT_THROW(Experiment::Scan(kSample, std::make_shared<const rigtrace::interp::TypeRegistry>()),
               rigtrace::interp::RegistryError);
  EXPECT_THROW(Experiment::Scan(kSample / "missing", BuiltinRegistry()), std::runtime_error);
}

TEST(ExperimentTest, ProbesCommonTimeSpanWithoutDecoding) {
  const auto registry = BuiltinRegistry();
  const auto span = Experiment::ProbeTimeSpan(kSample, *registry);

  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->start_ns, 2000000000);
  EXPECT_EQ(span->end_ns, 1700000000);

  const ScopedTempDir dir;
  WriteTextFile(dir.path() / "notes.txt", "nothing here\n");
  EXPECT_FALSE(Experiment::ProbeTimeSpan(dir.path(), *registry).has_value());
}

TEST(ExperimentTest, GarbageWithALogExtensionIsDiagnosed) {
  const ScopedTempDir dir;
  CopySample("fictrac_trial.csv", dir.path());
  CopySample("warner_temp_read.csv", dir.path());
  constexpr char kGarbage[] = "\x00\x01\x02 not a table";
  WriteTextFile(dir.path() / "garbage.csv", std::string(kGarbage, sizeof(kGarbage) - 1));

  const Experiment experiment = Experiment::Scan(dir.path(), BuiltinRegistry());

  EXPECT_EQ(Filenames(experiment.interpreters()),
            (std::vector<std::string>{"fictrac_trial.csv", "warner_temp_read.csv"}));
  EXPECT_EQ(Filenames(experiment.unclassified()), (std::vector<std::string>{"garbage.csv"}));
  EXPECT_FALSE(experiment.unclassified().front().reason.empty());
  EXPECT_EQ(experiment.alignment_epoch_ns(), 1500000000);
  EXPECT_EQ(experiment.First(rigtrace::interp::kFicTracTag)->AlignedTimestamps().front(), 500000000);
}

TEST(ExperimentTest, CancelBeforeAdjacentFilesIsPartial) {
  const ScopedTempDir dir;
  WriteTextFile(dir.path() / "trial" / "trigger_log.csv", "timestamp,pulse\n1,0\n");
  CopySample("fictrac_trial.csv", dir.path() / "sibling");

  std::atomic<bool> cancel{false};
  auto registry = std::make_shared<rigtrace::interp::TypeRegistry>();
  rigtrace::interp::RegisterBuiltinLogTypes(*registry);
  registry->Register("trigger",
                     std::make_shared<rigtrace::io::SignatureClassifier>(
                         "Trigger", rigtrace::io::LogSignature{".csv", {"trigger"}, {}, {}}),
                     std::make_shared<CancellingDecoder>(&cancel));

  ScanOptions options;
  options.workers = 1;
  options.cancel = &cancel;
  const Experiment experiment = Experiment::Scan(dir.path() / "trial", registry, options);

  EXPECT_TRUE(cancel.load());
  EXPECT_TRUE(experiment.is_partial());
  EXPECT_FALSE(experiment.probed_adjacent());
  EXPECT_TRUE(experiment.interpreters().empty());
  EXPECT_EQ(Filenames(experiment.errored()), (std::vector<std::string>{"trigger_log.csv"}));

  const Experiment rescanned = experiment.Rescan();
  EXPECT_TRUE(rescanned.probed_adjacent());
}

TEST(ExperimentTest, TimeSpanSkipsAmbiguousFiles) {
  const ScopedTempDir dir;
  CopySample("fictrac_trial.csv", dir.path());
  std::ifstream in(kSample / "fictrac_trial.csv");
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  for (const auto& [from, to] : std::vector<std::pair<std::string, std::string>>{
           {"2000000000,", "9000000000,"}, {"2500000000,", "9500000000,"}, {"3000000000,", "9900000000,"}}) {
    text.replace(text.find(from), from.size(), to);
  }
  WriteTextFile(dir.path() / "late_picopump.csv", text);

  const auto registry = BuiltinRegistry();
  const auto span = Experiment::ProbeTimeSpan(dir.path(), *registry);
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->start_ns, 2000000000);
  EXPECT_EQ(span->end_ns, 3000000000);

  const Experiment experiment = Experiment::Scan(dir.path(), registry);
  EXPECT_EQ(Filenames(experiment.ambiguous()), (std::vector<std::string>{"late_picopump.csv"}));
}

TEST(ExperimentTest, TimeSpanFallsBackToAdjacentFiles) {
  const ScopedTempDir dir;
  WriteTextFile(dir.path() / "trial" / "notes.txt", "empty trial\n");
  CopySample("warner_temp_read.csv", dir.path() / "temperature");

  const auto registry = BuiltinRegistry();
  const auto span = Experiment::ProbeTimeSpan(dir.path() / "trial", *registry);
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(span->start_ns, 1500000000);
  EXPECT_EQ(span->end_ns, 1700000000);

  ScanOptions options;
  options.probe_adjacent = false;
  EXPECT_FALSE(Experiment::ProbeTimeSpan(dir.path() / "trial", *registry, options).has_value());
}

TEST(ExperimentTest, MoreWorkersThanFiles) {
  ScanOptions options;
  options.workers = 64;
  const Experiment experiment = Experiment::Scan(kSample, BuiltinRegistry(), options);

  EXPECT_FALSE(experiment.is_partial());
  EXPECT_EQ(experiment.scanned_file_count(), 5);
  EXPECT_EQ(Filenames(experiment.interpreters()),
            (std::vector<std::string>{"fictrac_trial.csv", "warner_temp_read.csv"}));
}
