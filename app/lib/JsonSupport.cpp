/*
 * jsoncpp helpers
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "JsonSupport.hpp"

#include <sstream>

namespace JsonSupport {

bool parse(const std::string& text, Json::Value& root, std::string* errors)
{
    Json::CharReaderBuilder reader_builder;
    std::istringstream stream(text);
    std::string parse_errors;

    if (!Json::parseFromStream(reader_builder, stream, &root, &parse_errors)) {
        if (errors) {
            *errors = parse_errors;
        }
        return false;
    }
    return true;
}

std::string to_compact_string(const Json::Value& value)
{
    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    writer_builder["emitUTF8"] = true;
    return Json::writeString(writer_builder, value);
}

std::string string_member(const Json::Value& object, const char* key)
{
    if (!object.isObject() || !object.isMember(key) || !object[key].isString()) {
        return {};
    }
    return object[key].asString();
}

std::string scalar_to_string(const Json::Value& value)
{
    if (value.isString()) {
        return value.asString();
    }
    if (value.isBool()) {
        return value.asBool() ? "true" : "false";
    }
    if (value.isIntegral()) {
        return value.isUInt64() ? std::to_string(value.asUInt64())
                                : std::to_string(value.asInt64());
    }
    if (value.isDouble()) {
        std::ostringstream out;
        out << value.asDouble();
        return out.str();
    }
    return {};
}

} // namespace JsonSupport
