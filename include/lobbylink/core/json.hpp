#pragma once

#include <json/json.h>
#include <cstdint>
#include <string>

namespace lobbylink::core::json {

// Throws ProtocolError when the text is not a JSON object.
Json::Value parse_object(const std::string& text);

// Compact single-line output.
std::string write(const Json::Value& value);

// Accessors used by the wire decoders. The require_* variants throw
// ProtocolError naming the missing or mistyped field.
std::string require_string(const Json::Value& object, const char* field);
std::int64_t require_int64(const Json::Value& object, const char* field);
bool require_bool(const Json::Value& object, const char* field);
const Json::Value& require_object(const Json::Value& object, const char* field);

std::string optional_string(const Json::Value& object, const char* field,
                            const std::string& fallback = "");
std::int64_t optional_int64(const Json::Value& object, const char* field, std::int64_t fallback = 0);
bool optional_bool(const Json::Value& object, const char* field, bool fallback = false);

}
