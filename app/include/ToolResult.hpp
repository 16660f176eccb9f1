/*
 * Uniform success/failure envelope for analysis tools
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TOOL_RESULT_HPP
#define TOOL_RESULT_HPP

#include "GatewayTypes.hpp"
#include "SearchTypes.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <optional>
#include <string>

/**
 * Result envelope returned by tool and analysis steps.
 *
 * Only ok() and fail() construct it. A success never carries an error
 * message; a failure always carries one and never carries content.
 * Check success() before reading content().
 */
class ToolResult {
public:
    /**
     * @param artifacts JSON array of structured artifacts (null means none)
     * @param metadata JSON object, e.g. cost and duration (null means none)
     * @throws std::invalid_argument if artifacts is not an array or metadata not an object
     */
    static ToolResult ok(std::string content,
                         Json::Value artifacts = Json::Value(Json::arrayValue),
                         Json::Value metadata = Json::Value(Json::objectValue));

    /**
     * @throws std::invalid_argument if error_message is empty or metadata not an object
     */
    static ToolResult fail(std::string error_message,
                           Json::Value metadata = Json::Value(Json::objectValue));

    bool success() const { return success_; }
    const std::string& content() const { return content_; }
    const Json::Value& artifacts() const { return artifacts_; }
    const std::optional<std::string>& error_message() const { return error_message_; }
    const Json::Value& metadata() const { return metadata_; }

    Json::Value to_json() const;

private:
    ToolResult(bool success,
               std::string content,
               Json::Value artifacts,
               std::optional<std::string> error_message,
               Json::Value metadata);

    bool success_;
    std::string content_;
    Json::Value artifacts_;
    std::optional<std::string> error_message_;
    Json::Value metadata_;
};

/**
 * Wrap a gateway outcome; metadata carries provider, cost, duration and,
 * on failure, the failure kind, retry hint and per-provider attempts.
 */
ToolResult to_tool_result(const InvocationOutcome& outcome);
ToolResult to_tool_result(const SearchOutcome& outcome);

#endif // TOOL_RESULT_HPP
