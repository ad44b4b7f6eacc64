/*
 * jsoncpp include shim and small helpers
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef JSON_SUPPORT_HPP
#define JSON_SUPPORT_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <string>

namespace JsonSupport {

/**
 * Parse a JSON document
 * @param text Raw document
 * @param root Receives the parsed value
 * @param errors Optional parser diagnostics on failure
 * @return true when the document parsed
 */
bool parse(const std::string& text, Json::Value& root, std::string* errors = nullptr);

/**
 * Serialize without indentation (wire format)
 */
std::string to_compact_string(const Json::Value& value);

/**
 * Non-empty string member, or empty string when absent or not a string
 */
std::string string_member(const Json::Value& object, const char* key);

/**
 * Render a scalar (string, integer, real, bool) as text; empty for others
 */
std::string scalar_to_string(const Json::Value& value);

} // namespace JsonSupport

#endif // JSON_SUPPORT_HPP
