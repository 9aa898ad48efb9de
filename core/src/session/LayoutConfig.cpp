#include "rc/session/LayoutConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace rc {

std::string serializeLayoutConfig(const LayoutConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(config.version.c_str(), alloc), alloc);

  // Tick layout
  rapidjson::Value ticks(rapidjson::kObjectType);
  ticks.AddMember("maxMajorTicks", config.ticks.maxMajorTicks, alloc);
  ticks.AddMember("scenesPerLabel", config.ticks.scenesPerLabel, alloc);
  ticks.AddMember("wrapEpsilon", config.ticks.wrapEpsilon, alloc);
  ticks.AddMember("minorStepRad", config.ticks.minorStepRad, alloc);
  ticks.AddMember("maxMinorPerGap", config.ticks.maxMinorPerGap, alloc);
  ticks.AddMember("minorCoincideEpsilon", config.ticks.minorCoincideEpsilon, alloc);
  doc.AddMember("ticks", ticks, alloc);

  // Discontinuities
  rapidjson::Value disc(rapidjson::kObjectType);
  disc.AddMember("multiplier", config.discontinuityMultiplier, alloc);
  disc.AddMember("floorMs", config.discontinuityFloorMs, alloc);
  disc.AddMember("threshold",
                 rapidjson::Value(config.discontinuityThreshold.c_str(), alloc), alloc);
  doc.AddMember("discontinuity", disc, alloc);

  doc.AddMember("durationCapSelection",
                rapidjson::Value(config.durationCapSelection.c_str(), alloc), alloc);
  doc.AddMember("timeLabelCount", config.timeLabelCount, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (obj.HasMember(key) && obj[key].IsInt()) out = obj[key].GetInt();
}

static void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

static void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  if (obj.HasMember(key) && obj[key].IsString()) out = obj[key].GetString();
}

bool deserializeLayoutConfig(const std::string& json, LayoutConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  readString(doc, "version", out.version);

  if (doc.HasMember("ticks") && doc["ticks"].IsObject()) {
    const auto& t = doc["ticks"];
    readInt(t, "maxMajorTicks", out.ticks.maxMajorTicks);
    readInt(t, "scenesPerLabel", out.ticks.scenesPerLabel);
    readDouble(t, "wrapEpsilon", out.ticks.wrapEpsilon);
    readDouble(t, "minorStepRad", out.ticks.minorStepRad);
    readInt(t, "maxMinorPerGap", out.ticks.maxMinorPerGap);
    readDouble(t, "minorCoincideEpsilon", out.ticks.minorCoincideEpsilon);
  }

  if (doc.HasMember("discontinuity") && doc["discontinuity"].IsObject()) {
    const auto& d = doc["discontinuity"];
    readDouble(d, "multiplier", out.discontinuityMultiplier);
    readDouble(d, "floorMs", out.discontinuityFloorMs);
    readString(d, "threshold", out.discontinuityThreshold);
  }

  readString(doc, "durationCapSelection", out.durationCapSelection);
  readInt(doc, "timeLabelCount", out.timeLabelCount);

  return true;
}

} // namespace rc
