#include "json_util.h"

#include <memory>

namespace pyexec {

namespace {

constexpr int MAX_NESTING = 32;

const Json::Value* member(const Json::Value& object, const std::string& key) {
    if (!object.isObject()) {
        return nullptr;
    }
    const Json::Value* value = object.find(key.data(), key.data() + key.size());
    if (!value || value->isNull()) {
        return nullptr;
    }
    return value;
}

} // anonymous namespace

Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["allowTrailingCommas"] = false;
    builder["stackLimit"] = MAX_NESTING;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            throw JsonParseError(errors.empty() ? "unparseable document" : errors);
        }
    } catch (const Json::Exception& e) {
        // stackLimit overruns are thrown rather than reported
        throw JsonParseError(e.what());
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

Json::Value to_json_array(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value to_json_object(const std::map<std::string, std::string>& values) {
    Json::Value object(Json::objectValue);
    for (const auto& [key, value] : values) {
        object[key] = value;
    }
    return object;
}

std::optional<std::string> get_string(const Json::Value& object, const std::string& key) {
    const Json::Value* value = member(object, key);
    if (!value) return std::nullopt;
    if (!value->isString()) {
        throw JsonParseError("field '" + key + "' must be a string");
    }
    return value->asString();
}

std::optional<long long> get_int(const Json::Value& object, const std::string& key) {
    const Json::Value* value = member(object, key);
    if (!value) return std::nullopt;
    if (!value->isInt64() || value->isBool()) {
        throw JsonParseError("field '" + key + "' must be an integer");
    }
    return static_cast<long long>(value->asInt64());
}

std::optional<std::vector<std::string>> get_string_array(const Json::Value& object,
                                                         const std::string& key) {
    const Json::Value* value = member(object, key);
    if (!value) return std::nullopt;
    if (!value->isArray()) {
        throw JsonParseError("field '" + key + "' must be an array of strings");
    }

    std::vector<std::string> result;
    for (const auto& item : *value) {
        if (!item.isString()) {
            throw JsonParseError("field '" + key + "' must be an array of strings");
        }
        result.push_back(item.asString());
    }
    return result;
}

std::optional<std::map<std::string, std::string>> get_string_map(const Json::Value& object,
                                                                 const std::string& key) {
    const Json::Value* value = member(object, key);
    if (!value) return std::nullopt;
    if (!value->isObject()) {
        throw JsonParseError("field '" + key + "' must be an object of strings");
    }

    std::map<std::string, std::string> result;
    for (const auto& name : value->getMemberNames()) {
        const Json::Value& item = (*value)[name];
        if (!item.isString()) {
            throw JsonParseError("field '" + key + "' must be an object of strings");
        }
        result[name] = item.asString();
    }
    return result;
}

} // namespace pyexec
