#pragma once

// Typed field accessors over RapidJSON values, shared by the loaders.
// Every failure is a LoaderError carrying the JSON path in its context.

#include <dcsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace dcsim::io::detail {

inline const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                          const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

inline double get_double(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

inline uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint64();
}

inline std::string get_string(const rapidjson::Value& obj, const char* name,
                              const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

inline const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                         const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters: absent means default, present with the wrong type is
// still an error

inline double get_double_or(const rapidjson::Value& obj, const char* name, double fallback,
                            const std::string& context) {
    return obj.HasMember(name) ? get_double(obj, name, context) : fallback;
}

inline uint64_t get_uint64_or(const rapidjson::Value& obj, const char* name, uint64_t fallback,
                              const std::string& context) {
    return obj.HasMember(name) ? get_uint64(obj, name, context) : fallback;
}

inline bool get_bool_or(const rapidjson::Value& obj, const char* name, bool fallback,
                        const std::string& context) {
    if (!obj.HasMember(name)) {
        return fallback;
    }
    const auto& member = obj[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

inline std::string element_path(const std::string& parent, const char* array,
                                rapidjson::SizeType index) {
    std::string path = parent.empty() ? std::string(array) : parent + "." + array;
    return path + "[" + std::to_string(index) + "]";
}

/// Parse @p json into @p doc, checking the root is an object.
inline void parse_document(rapidjson::Document& doc, std::string_view json, const char* what) {
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", what);
    }
}

} // namespace dcsim::io::detail
