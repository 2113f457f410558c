#pragma once

#include <string>

#include "core/types.hpp"

namespace rover {

std::string jsonEscape(const std::string& s);

std::string frameToJson(const Frame& frame);
std::string telemetryToJson(const TelemetrySample& sample);

// Reads a top-level string member of a JSON object body. Returns false when
// the body is not a JSON object, or the key is absent or not a string.
bool extractJsonStringField(const std::string& body, const std::string& key, std::string& out);

std::string okReplyJson();
std::string errorReplyJson(const std::string& detail);
std::string stateReplyJson(const std::string& state);

}  // namespace rover
