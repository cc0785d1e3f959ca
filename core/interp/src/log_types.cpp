#include "rigtrace/interp/log_types.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "rigtrace/interp/interpreter.hpp"
#include "rigtrace/io/classifier.hpp"
#include "rigtrace/io/csv_log.hpp"
#include "rigtrace/io/structured_log.hpp"

namespace rigtrace::interp {
namespace {

const std::vector<std::string> kFicTracColumns = {
    "timestamp",
    "frame_id",
    "frame_counter",
    "delta_rotation_cam_0",
    "delta_rotation_cam_1",
    "delta_rotation_cam_2",
    "delta_rotation_error",
    "delta_rotation_lab_0",
    "delta_rotation_lab_1",
    "delta_rotation_lab_2",
    "absolute_rotation_cam_0",
    "absolute_rotation_cam_1",
    "absolute_rotation_cam_2",
    "absolute_rotation_lab_0",
    "absolute_rotation_lab_1",
    "absolute_rotation_lab_2",
    "integrated_position_lab_0",
    "integrated_position_lab_1",
    "integrated_heading_lab",
    "animal_movement_direction_lab",
    "animal_movement_speed",
    "integrated_motion_0",
    "integrated_motion_1",
    "sequence_counter",
};

const std::vector<std::string> kWarnerColumns = {
    "timestamp",
    "frame_id",
    "Temperature (C)_0_channel_idx",
    "Temperature (C)_0_voltage",
};

const std::vector<std::string> kVrPositionColumns = {
    "timestamp",
    "frame_id",
    "rotation_x",
    "rotation_y",
    "rotation_z",
    "position_x",
    "position_y",
    "position_z",
};

const std::vector<std::string> kEventColumns = {
    "timestamp",
    "Event type",
    "Event message",
};

constexpr double kNanosecondsPerSecond = 1e9;

std::shared_ptr<const io::LogClassifier> Signature(std::string name, io::LogSignature signature) {
  return std::make_shared<io::SignatureClassifier>(std::move(name), std::move(signature));
}

SignalFn Column(std::string field) {
  return [field = std::move(field)](const Interpreter& interpreter) { return interpreter.NumericColumn(field); };
}

// Seconds between consecutive records; element 0 is NaN.
std::vector<double> IntervalsSeconds(const Interpreter& interpreter) {
  const auto timestamps = interpreter.Timestamps();
  std::vector<double> dt(timestamps.size(), std::numeric_limits<double>::quiet_NaN());
  for (std::size_t i = 1; i < timestamps.size(); ++i) {
    dt[i] = static_cast<double>(timestamps[i] - timestamps[i - 1]) / kNanosecondsPerSecond;
  }
  return dt;
}

double Rate(double delta, double dt) {
  return dt > 0.0 ? delta / dt : std::numeric_limits<double>::quiet_NaN();
}

// rad/s, counter-clockwise positive. One value per pair of consecutive records.
std::vector<double> FicTracAngularVelocity(const Interpreter& interpreter) {
  const auto heading = interpreter.NumericColumn("integrated_heading_lab");
  const auto dt = IntervalsSeconds(interpreter);
  std::vector<double> velocity;
  for (std::size_t i = 1; i < heading.size(); ++i) {
    const double turn = std::remainder(heading[i] - heading[i - 1], 2.0 * std::numbers::pi);
    velocity.push_back(Rate(-turn, dt[i]));
  }
  return velocity;
}

std::vector<double> FicTracMovementSpeed(const Interpreter& interpreter) {
  const auto speed = interpreter.NumericColumn("animal_movement_speed");
  const auto dt = IntervalsSeconds(interpreter);
  std::vector<double> rate;
  for (std::size_t i = 1; i < speed.size(); ++i) {
    rate.push_back(Rate(speed[i], dt[i]));
  }
  return rate;
}

// Displacement between consecutive records in the frame of the earlier heading: the imaginary part
// runs along the heading, the real part across it.
std::vector<std::complex<double>> FicTracHeadingProjection(const Interpreter& interpreter) {
  const auto x = interpreter.NumericColumn("integrated_position_lab_0");
  const auto y = interpreter.NumericColumn("integrated_position_lab_1");
  const auto heading = interpreter.NumericColumn("integrated_heading_lab");
  std::vector<std::complex<double>> projection;
  for (std::size_t i = 1; i < x.size(); ++i) {
    const std::complex<double> step(x[i] - x[i - 1], y[i] - y[i - 1]);
    projection.push_back(step / std::polar(1.0, heading[i - 1]));
  }
  return projection;
}

template <typename Component>
std::vector<double> FicTracProjectedRate(const Interpreter& interpreter, Component component) {
  const auto projection = FicTracHeadingProjection(interpreter);
  const auto dt = IntervalsSeconds(interpreter);
  std::vector<double> rate;
  rate.reserve(projection.size());
  for (std::size_t i = 0; i < projection.size(); ++i) {
    rate.push_back(Rate(component(projection[i]), dt[i + 1]));
  }
  return rate;
}

// rad/s along the heading.
std::vector<double> FicTracForwardSpeed(const Interpreter& interpreter) {
  return FicTracProjectedRate(interpreter, [](const std::complex<double>& p) { return p.imag(); });
}

// rad/s orthogonal to the heading.
std::vector<double> FicTracSideslip(const Interpreter& interpreter) {
  return FicTracProjectedRate(interpreter, [](const std::complex<double>& p) { return p.real(); });
}

std::vector<double> FicTracTranslationalSpeed(const Interpreter& interpreter) {
  return FicTracProjectedRate(interpreter, [](const std::complex<double>& p) { return std::abs(p); });
}

// VR position in mm. The logged frame has the bar straight ahead at +y.
std::vector<std::complex<double>> VrPositionMm(const Interpreter& interpreter) {
  constexpr double kBarInFrontAngle = 0.0;
  const auto x = interpreter.NumericColumn("position_x");
  const auto y = interpreter.NumericColumn("position_y");
  const std::complex<double> rotation = std::polar(kVrBallRadiusMm, kBarInFrontAngle);
  std::vector<std::complex<double>> position;
  position.reserve(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    position.push_back(std::complex<double>(0.0, 1.0) * std::complex<double>(x[i], -y[i]) * rotation);
  }
  return position;
}

std::vector<double> VrXPosition(const Interpreter& interpreter) {
  std::vector<double> x;
  for (const auto& p : VrPositionMm(interpreter)) {
    x.push_back(p.real());
  }
  return x;
}

std::vector<double> VrYPosition(const Interpreter& interpreter) {
  std::vector<double> y;
  for (const auto& p : VrPositionMm(interpreter)) {
    y.push_back(p.imag());
  }
  return y;
}

// mm/s; element 0 is NaN.
std::vector<double> VrTranslationSpeed(const Interpreter& interpreter) {
  const auto position = VrPositionMm(interpreter);
  const auto dt = IntervalsSeconds(interpreter);
  std::vector<double> speed(position.size(), std::numeric_limits<double>::quiet_NaN());
  for (std::size_t i = 1; i < position.size(); ++i) {
    speed[i] = Rate(std::abs(position[i] - position[i - 1]), dt[i]);
  }
  return speed;
}

// Wrapped to (-pi, pi]; 0 is the bar straight ahead.
std::vector<double> VrHeading(const Interpreter& interpreter) {
  constexpr double kBarInFrontAngle = 0.0;
  auto heading = interpreter.NumericColumn("rotation_z");
  for (double& angle : heading) {
    angle = std::arg(std::polar(1.0, angle) * std::polar(1.0, -kBarInFrontAngle));
  }
  return heading;
}

// VR heading with jumps larger than pi replaced by their 2*pi complement.
std::vector<double> VrUnwrappedHeading(const Interpreter& interpreter) {
  const auto wrapped = VrHeading(interpreter);
  std::vector<double> unwrapped = wrapped;
  double correction = 0.0;
  for (std::size_t i = 1; i < wrapped.size(); ++i) {
    const double step = wrapped[i] - wrapped[i - 1];
    if (step > std::numbers::pi) {
      correction -= 2.0 * std::numbers::pi;
    } else if (step < -std::numbers::pi) {
      correction += 2.0 * std::numbers::pi;
    }
    unwrapped[i] = wrapped[i] + correction;
  }
  return unwrapped;
}

std::vector<double> LaserActive(const Interpreter& interpreter) {
  auto active = interpreter.NumericColumn("laser_const_set_active");
  const auto exponential = interpreter.NumericColumn("laser_exponential_set_active");
  for (std::size_t i = 0; i < active.size(); ++i) {
    active[i] = (active[i] > 0.0 || exponential[i] > 0.0) ? 1.0 : 0.0;
  }
  return active;
}

// The pump's column is named after the device, e.g. "picopump_0".
std::vector<double> PicoPumpFlow(const Interpreter& interpreter) {
  const auto& fields = interpreter.field_names();
  const auto it = std::find_if(fields.begin(), fields.end(), [](const std::string& field) {
    return field.find("picopump") != std::string::npos;
  });
  if (it == fields.end()) {
    throw std::out_of_range(fmt::format("{} has no picopump column", interpreter.source_path().string()));
  }
  return interpreter.NumericColumn(*it);
}

// Specifications written before the bar-in-front convention lack start_bar_in_front.
std::vector<double> OldProjectorSpec(const Interpreter& interpreter) {
  return {interpreter.log().HasField("start_bar_in_front") ? 0.0 : 1.0};
}

VersionRequirement Version(std::string repo_name,
                           std::string branch,
                           std::string package,
                           std::vector<std::string> executables,
                           std::string validated_commit_time,
                           std::string commit_hash = {}) {
  return VersionRequirement{std::move(repo_name),
                            std::move(branch),
                            std::move(package),
                            std::move(executables),
                            std::move(validated_commit_time),
                            std::move(commit_hash)};
}

const FacetSet kAllFacets = {Facet::kConfigProvenance, Facet::kVersionProvenance, Facet::kTimeBase};

}  // namespace

void RegisterBuiltinLogTypes(TypeRegistry& registry) {
  const auto csv = std::make_shared<io::CsvLogDecoder>();
  const auto structured = std::make_shared<io::StructuredLogDecoder>();

  {
    InterpreterTraits traits;
    traits.description = "FicTrac ball tracking (fictrac_ros2 trackmovements)";
    traits.facets = kAllFacets;
    traits.config_selector.executables_by_package = {{"fictrac_ros2", {"trackmovements"}}};
    traits.validated_versions = {
        Version("fictrac_ros2", "main", "fictrac_ros2", {"trackmovements"}, "2022-08-19 16:51:19-04:00")};
    traits.signals = {
        {"x_position", Column("integrated_position_lab_0")},
        {"y_position", Column("integrated_position_lab_1")},
        {"heading", Column("integrated_heading_lab")},
        {"angular_velocity", FicTracAngularVelocity},
        {"movement_speed", FicTracMovementSpeed},
        {"forward_speed", FicTracForwardSpeed},
        {"sideslip", FicTracSideslip},
        {"translational_speed", FicTracTranslationalSpeed},
    };
    registry.Register(kFicTracTag,
                      Signature("FicTrac", {".csv", {}, {}, kFicTracColumns}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Warner temperature controller readout (mcc_driver warner_temp_control)";
    traits.facets = kAllFacets;
    traits.config_selector.executables_by_package = {{"mcc_driver", {"warner_temp_control"}}};
    traits.validated_versions = {
        Version("mcc_driver", "sct_dev", "mcc_driver", {"warner_temp_control"}, "2023-01-06 14:18:25-5:00")};
    traits.signals = {{"temperature", Column("Temperature (C)_0_voltage")}};
    registry.Register(kWarnerTemperatureTag,
                      Signature("WarnerTemperature", {".csv", {"read"}, {}, kWarnerColumns}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Closed-loop VR position (eternarig_experiment_logic)";
    traits.facets = kAllFacets;
    traits.companions = CompanionLocation::kParentDirectory;
    traits.config_selector.executables_by_package = {{"eternarig_experiment_logic", {"sct_sutter_bar"}}};
    traits.validated_versions = {Version("eternarig_experiment_logic",
                                         "sct_eternarig_dev",
                                         "eternarig_experiment_logic",
                                         {"sct_sutter_bar"},
                                         "2024-11-17 18:06:25-05:00")};
    traits.signals = {
        {"x_position", VrXPosition},
        {"y_position", VrYPosition},
        {"vr_translation_speed", VrTranslationSpeed},
        {"vr_heading", VrHeading},
        {"unwrapped_heading", VrUnwrappedHeading},
    };
    registry.Register(kVrPositionTag,
                      Signature("VRPosition", {".csv", {}, {}, kVrPositionColumns}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Experiment logic events (eternarig_experiment_logic)";
    traits.facets = {Facet::kConfigProvenance, Facet::kVersionProvenance};
    traits.companions = CompanionLocation::kParentDirectory;
    traits.config_selector.executables_by_package = {{"eternarig_experiment_logic", {"sct_sutter_bar"}}};
    traits.validated_versions = {Version("eternarig_experiment_logic",
                                         "sct_eternarig_dev",
                                         "eternarig_experiment_logic",
                                         {"sct_sutter_bar"},
                                         "2024-11-17 18:06:25-05:00")};
    registry.Register(kEventsTag,
                      Signature("Events", {".csv", {}, {}, kEventColumns}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Light and sugar delivery driver";
    traits.facets = {Facet::kConfigProvenance};
    traits.config_selector.executables_by_package = {{"light_sugar_driver", {"light_sugar_driver_node"}}};
    traits.signals = {
        {"sugar_feed_active", Column("sugar_feed_active")},
        {"laser_active", LaserActive},
    };
    registry.Register(kLightSugarTag,
                      Signature("LightSugar", {".csv", {"light_sugar_driver"}, {}, {}}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "PicoPump flow (mcc_driver mcc1208fs_adio)";
    traits.facets = kAllFacets;
    traits.config_selector.executables_by_package = {{"mcc_driver", {"warner_temp_control", "mcc1208fs_adio"}}};
    traits.validated_versions = {Version("mcc_driver",
                                         "sct_dev",
                                         "mcc_driver",
                                         {"mcc1208fs_adio"},
                                         "2024-04-14 19:00:43-04:00",
                                         "af2adae8e219951151a7dbcdfc9a80885ffbb228")};
    traits.signals = {{"flow", PicoPumpFlow}};
    registry.Register(kPicoPumpTag,
                      Signature("PicoPump", {".csv", {"picopump"}, {}, {}}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Unity VR driver commands";
    traits.facets = {Facet::kConfigProvenance};
    traits.config_selector.executables_by_package = {{"unity_vr_driver", {}}};
    registry.Register(kUnityVrCommandTag,
                      Signature("UnityVrCommand", {".csv", {"unity_vr_driver_vrcmd"}, {}, {}}),
                      csv,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Session metadata document";
    registry.Register(kMetadataTag,
                      Signature("Metadata", {".json", {"metadata"}, {}, {}}),
                      structured,
                      std::move(traits));
  }

  {
    InterpreterTraits traits;
    traits.description = "Projector bar specification";
    traits.facets = {Facet::kConfigProvenance, Facet::kVersionProvenance};
    traits.config_selector.executables_by_package = {
        {"projector_driver", {"projector_bar"}},
        {"dlpc_projector_settings", {"dlpc_projector_settings"}},
    };
    traits.validated_versions = {
        Version("projector_driver", "set_parameters_executable", "projector_driver", {"projector_bar"},
                "2023-01-06 14:28:51-05:00"),
        Version("projector_driver", "set_parameters_executable", "dlpc_projector_settings",
                {"dlpc_projector_settings"}, "2023-01-06 14:28:51-05:00"),
    };
    traits.signals = {{"old_projector_spec", OldProjectorSpec}};
    registry.Register(kProjectorTag,
                      Signature("Projector", {".yaml", {"projector_bar_specifications"}, {}, {}}),
                      structured,
                      std::move(traits));
  }
}

}  // namespace rigtrace::interp
