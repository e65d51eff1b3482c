#pragma once

#include <json/json.h>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyexec {

class JsonParseError : public std::runtime_error {
public:
    explicit JsonParseError(const std::string& message)
        : std::runtime_error("Malformed JSON: " + message) {}
};

// Strict parse: object or array root, no comments, no trailing commas,
// nesting capped. Throws JsonParseError.
Json::Value parse_json(const std::string& text);

// Compact single-line output, UTF-8 passed through unescaped
std::string write_json(const Json::Value& value);

Json::Value to_json_array(const std::vector<std::string>& values);
Json::Value to_json_object(const std::map<std::string, std::string>& values);

// Typed member access. Absent or null → nullopt.
// Present with the wrong type → JsonParseError.
std::optional<std::string> get_string(const Json::Value& object, const std::string& key);
std::optional<long long> get_int(const Json::Value& object, const std::string& key);
std::optional<std::vector<std::string>> get_string_array(const Json::Value& object,
                                                         const std::string& key);
std::optional<std::map<std::string, std::string>> get_string_map(const Json::Value& object,
                                                                 const std::string& key);

} // namespace pyexec
