#pragma once

#include "rigtrace/interp/type_registry.hpp"

namespace rigtrace::interp {

inline constexpr char kFicTracTag[] = "fictrac";
inline constexpr char kWarnerTemperatureTag[] = "warner_temperature";
inline constexpr char kVrPositionTag[] = "vr_position";
inline constexpr char kEventsTag[] = "events";
inline constexpr char kLightSugarTag[] = "light_sugar";
inline constexpr char kPicoPumpTag[] = "picopump";
inline constexpr char kUnityVrCommandTag[] = "unity_vr_command";
inline constexpr char kMetadataTag[] = "metadata";
inline constexpr char kProjectorTag[] = "projector";

// Ball radius used to turn VR position units into millimetres.
inline constexpr double kVrBallRadiusMm = 3.0;

// Registers every log type produced by the rig's ROS nodes.
void RegisterBuiltinLogTypes(TypeRegistry& registry);

}  // namespace rigtrace::interp
