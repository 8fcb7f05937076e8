#include "blockshift/util/OptionsSerializer.h"
#include "blockshift/common/Logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace blockshift {

namespace {

json sizeToJson(const Size& size) {
    return {{"width", size.width}, {"height", size.height}};
}

Size sizeFromJson(const json& j, const Size& fallback) {
    return {j.value("width", fallback.width), j.value("height", fallback.height)};
}

void checkRange(bool ok, const char* key) {
    if (!ok) {
        throw std::runtime_error(std::string("MoveOptions value out of range: ") + key);
    }
}

}  // namespace

std::string OptionsSerializer::toJson(const MoveOptions& options) {
    json j;
    j["version"] = 1;
    j["snapRadius"] = options.snapRadius;
    j["throttleIntervalMs"] = options.throttleInterval.count();
    j["stepDistance"] = options.stepDistance;
    j["maxHighlighted"] = options.maxHighlighted;
    j["maxCandidates"] = options.maxCandidates;
    j["watchdogTimeoutMs"] = options.watchdogTimeout.count();
    j["doubleTapIntervalMs"] = options.doubleTapInterval.count();
    j["doubleTapSlopDevice"] = options.doubleTapSlopDevice;
    j["tapSlopDevice"] = options.tapSlopDevice;
    j["markerHitPadding"] = options.markerHitPadding;
    j["notchSize"] = sizeToJson(options.notchSize);
    j["outlineSize"] = sizeToJson(options.outlineSize);
    j["highlightEnabled"] = options.highlightEnabled;
    return j.dump(2);
}

MoveOptions OptionsSerializer::optionsFromJson(const std::string& jsonStr) {
    MoveOptions options;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Failed to parse MoveOptions JSON: not an object");
        }

        options.snapRadius = j.value("snapRadius", options.snapRadius);
        options.throttleInterval = std::chrono::milliseconds(
            j.value("throttleIntervalMs", static_cast<int64_t>(options.throttleInterval.count())));
        options.stepDistance = j.value("stepDistance", options.stepDistance);
        options.maxHighlighted = j.value("maxHighlighted", options.maxHighlighted);
        options.maxCandidates = j.value("maxCandidates", options.maxCandidates);
        options.watchdogTimeout = std::chrono::milliseconds(
            j.value("watchdogTimeoutMs", static_cast<int64_t>(options.watchdogTimeout.count())));
        options.doubleTapInterval = std::chrono::milliseconds(
            j.value("doubleTapIntervalMs", static_cast<int64_t>(options.doubleTapInterval.count())));
        options.doubleTapSlopDevice = j.value("doubleTapSlopDevice", options.doubleTapSlopDevice);
        options.tapSlopDevice = j.value("tapSlopDevice", options.tapSlopDevice);
        options.markerHitPadding = j.value("markerHitPadding", options.markerHitPadding);
        if (j.contains("notchSize")) {
            options.notchSize = sizeFromJson(j["notchSize"], options.notchSize);
        }
        if (j.contains("outlineSize")) {
            options.outlineSize = sizeFromJson(j["outlineSize"], options.outlineSize);
        }
        options.highlightEnabled = j.value("highlightEnabled", options.highlightEnabled);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse MoveOptions JSON: ") + e.what());
    }

    checkRange(options.snapRadius >= 0.0f, "snapRadius");
    checkRange(options.throttleInterval.count() >= 0, "throttleIntervalMs");
    checkRange(options.stepDistance > 0.0f, "stepDistance");
    checkRange(options.watchdogTimeout.count() > 0, "watchdogTimeoutMs");
    checkRange(options.doubleTapInterval.count() >= 0, "doubleTapIntervalMs");
    checkRange(options.markerHitPadding >= 0.0f, "markerHitPadding");

    return options;
}

bool OptionsSerializer::fromJson(MoveOptions& options, const std::string& jsonStr) {
    try {
        options = optionsFromJson(jsonStr);
        return true;
    } catch (const std::runtime_error& e) {
        LOG_WARN("[OptionsSerializer] {}", e.what());
        return false;
    }
}

bool OptionsSerializer::saveToFile(const MoveOptions& options, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("[OptionsSerializer] cannot open {} for writing", path);
        return false;
    }
    file << toJson(options);
    return true;
}

bool OptionsSerializer::loadFromFile(MoveOptions& options, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("[OptionsSerializer] cannot open {}", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(options, buffer.str());
}

}  // namespace blockshift
