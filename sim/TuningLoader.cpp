#include "sim/Tuning.hpp"

#include "core/Log.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

struct FloatField {
  const char *key;
  float SimTuning::*member;
};

struct IntField {
  const char *key;
  int SimTuning::*member;
};

const FloatField kFloatFields[] = {
    {"viewportWidth", &SimTuning::viewportWidth},
    {"groundY", &SimTuning::groundY},
    {"starterHeight", &SimTuning::starterHeight},
    {"starterExtraWidth", &SimTuning::starterExtraWidth},
    {"starterGap", &SimTuning::starterGap},
    {"playerWidth", &SimTuning::playerWidth},
    {"playerHeight", &SimTuning::playerHeight},
    {"playerOffsetX", &SimTuning::playerOffsetX},
    {"gravity", &SimTuning::gravity},
    {"maxFallSpeed", &SimTuning::maxFallSpeed},
    {"jumpBufferTime", &SimTuning::jumpBufferTime},
    {"jumpCutMultiplier", &SimTuning::jumpCutMultiplier},
    {"baseSpeed", &SimTuning::baseSpeed},
    {"maxSpeed", &SimTuning::maxSpeed},
    {"speedRamp", &SimTuning::speedRamp},
    {"scorePerPixel", &SimTuning::scorePerPixel},
    {"horizonViewports", &SimTuning::horizonViewports},
    {"pruneMargin", &SimTuning::pruneMargin},
    {"continuitySpeed", &SimTuning::continuitySpeed},
    {"maxStepSlow", &SimTuning::maxStepSlow},
    {"maxStepFast", &SimTuning::maxStepFast},
    {"hazardChance", &SimTuning::hazardChance},
    {"hazardFastSpeed", &SimTuning::hazardFastSpeed},
    {"hazardFastFactor", &SimTuning::hazardFastFactor},
    {"minReactionTime", &SimTuning::minReactionTime},
    {"maxReactionTime", &SimTuning::maxReactionTime},
    {"minHazardSepTime", &SimTuning::minHazardSepTime},
    {"coinChance", &SimTuning::coinChance},
    {"coinSpacing", &SimTuning::coinSpacing},
    {"coinArcChance", &SimTuning::coinArcChance},
    {"magnetStrength", &SimTuning::magnetStrength},
};

const IntField kIntFields[] = {
    {"platformMinW", &SimTuning::platformMinW},
    {"platformMaxW", &SimTuning::platformMaxW},
    {"platformMinH", &SimTuning::platformMinH},
    {"platformMaxH", &SimTuning::platformMaxH},
    {"minGap", &SimTuning::minGap},
    {"maxGap", &SimTuning::maxGap},
    {"hazardMinW", &SimTuning::hazardMinW},
    {"hazardMaxW", &SimTuning::hazardMaxW},
    {"hazardMinH", &SimTuning::hazardMinH},
    {"hazardMaxH", &SimTuning::hazardMaxH},
    {"coinClusterMin", &SimTuning::coinClusterMin},
    {"coinClusterMax", &SimTuning::coinClusterMax},
};

bool IsKnownKey(const std::string &key) {
  for (const auto &f : kFloatFields) {
    if (key == f.key)
      return true;
  }
  for (const auto &f : kIntFields) {
    if (key == f.key)
      return true;
  }
  return false;
}

} // namespace

bool LoadTuningFromFile(SimTuning &tuning, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open tuning file: {}", path);
    return false;
  }

  SimTuning loaded = tuning;
  try {
    const json data = json::parse(f);
    if (!data.is_object()) {
      LOG_ERROR("Tuning file {} must contain a JSON object", path);
      return false;
    }

    for (const auto &field : kFloatFields) {
      if (!data.contains(field.key))
        continue;
      const auto &val = data[field.key];
      if (!val.is_number()) {
        LOG_ERROR("Tuning field '{}' in {} must be a number", field.key, path);
        return false;
      }
      loaded.*field.member = val.get<float>();
    }

    for (const auto &field : kIntFields) {
      if (!data.contains(field.key))
        continue;
      const auto &val = data[field.key];
      if (!val.is_number_integer()) {
        LOG_ERROR("Tuning field '{}' in {} must be an integer", field.key,
                  path);
        return false;
      }
      loaded.*field.member = val.get<int>();
    }

    for (const auto &item : data.items()) {
      if (!IsKnownKey(item.key())) {
        LOG_WARN("Ignoring unknown tuning field '{}' in {}", item.key(), path);
      }
    }
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse tuning file {}: {}", path, e.what());
    return false;
  }

  std::string error;
  if (!ValidateTuning(loaded, error)) {
    LOG_ERROR("Rejected tuning file {}: {}", path, error);
    return false;
  }

  tuning = loaded;
  LOG_INFO("Loaded tuning overrides from {}", path);
  return true;
}
