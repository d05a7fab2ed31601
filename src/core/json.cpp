#include "lobbylink/core/json.hpp"
#include "lobbylink/core/error.hpp"
#include <memory>

namespace lobbylink::core::json {

Json::Value parse_object(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ProtocolError("Malformed JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ProtocolError("Expected a JSON object");
    }
    return root;
}

std::string write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string require_string(const Json::Value& object, const char* field) {
    const auto& value = object[field];
    if (!value.isString()) {
        throw ProtocolError(std::string("Missing string field: ") + field);
    }
    return value.asString();
}

std::int64_t require_int64(const Json::Value& object, const char* field) {
    const auto& value = object[field];
    if (value.isInt64()) {
        return value.asInt64();
    }
    // browsers serialize large numbers as doubles
    if (value.isDouble()) {
        return static_cast<std::int64_t>(value.asDouble());
    }
    throw ProtocolError(std::string("Missing integer field: ") + field);
}

bool require_bool(const Json::Value& object, const char* field) {
    const auto& value = object[field];
    if (!value.isBool()) {
        throw ProtocolError(std::string("Missing boolean field: ") + field);
    }
    return value.asBool();
}

const Json::Value& require_object(const Json::Value& object, const char* field) {
    const auto& value = object[field];
    if (!value.isObject()) {
        throw ProtocolError(std::string("Missing object field: ") + field);
    }
    return value;
}

std::string optional_string(const Json::Value& object, const char* field, const std::string& fallback) {
    const auto& value = object[field];
    return value.isString() ? value.asString() : fallback;
}

std::int64_t optional_int64(const Json::Value& object, const char* field, std::int64_t fallback) {
    const auto& value = object[field];
    if (value.isInt64()) return value.asInt64();
    if (value.isDouble()) return static_cast<std::int64_t>(value.asDouble());
    return fallback;
}

bool optional_bool(const Json::Value& object, const char* field, bool fallback) {
    const auto& value = object[field];
    return value.isBool() ? value.asBool() : fallback;
}

}
