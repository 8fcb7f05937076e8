#include "blockshift/host/HostCapabilities.h"

namespace blockshift {

namespace {

std::string describeMissing(const std::vector<std::string>& missing) {
    std::string message = "Missing host capabilities:";
    for (const auto& name : missing) {
        message += " " + name;
    }
    return message;
}

}  // namespace

MissingHostCapabilityError::MissingHostCapabilityError(std::vector<std::string> missing)
    : std::invalid_argument(describeMissing(missing))
    , missing_(std::move(missing)) {
}

std::vector<std::string> HostCapabilities::missingCapabilities() const {
    std::vector<std::string> missing;
    if (!getNode) missing.emplace_back("getNode");
    if (!listNodes) missing.emplace_back("listNodes");
    if (!connectionsCompatible) missing.emplace_back("connectionsCompatible");
    if (!moveNodeTo) missing.emplace_back("moveNodeTo");
    if (!connect) missing.emplace_back("connect");
    if (!disconnect) missing.emplace_back("disconnect");
    if (!disconnectAll) missing.emplace_back("disconnectAll");
    if (!getViewport) missing.emplace_back("getViewport");
    return missing;
}

void HostCapabilities::validate() const {
    auto missing = missingCapabilities();
    if (!missing.empty()) {
        throw MissingHostCapabilityError(std::move(missing));
    }
}

}  // namespace blockshift
