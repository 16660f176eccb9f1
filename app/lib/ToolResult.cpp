/*
 * Result envelope implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ToolResult.hpp"

#include <sstream>
#include <stdexcept>

namespace {

Json::Value normalize_metadata(Json::Value metadata)
{
    if (metadata.isNull()) {
        return Json::Value(Json::objectValue);
    }
    if (!metadata.isObject()) {
        throw std::invalid_argument("ToolResult metadata must be a JSON object");
    }
    return metadata;
}

Json::Value attempts_to_json(const std::vector<AttemptNote>& attempts)
{
    Json::Value list(Json::arrayValue);
    for (const auto& note : attempts) {
        Json::Value item(Json::objectValue);
        item["provider"] = note.provider_id;
        item["disposition"] = to_string(note.disposition);
        if (!note.reason.empty()) {
            item["reason"] = note.reason;
        }
        if (note.retry_after.count() > 0) {
            item["retry_after_ms"] = static_cast<Json::Int64>(note.retry_after.count());
        }
        item["elapsed_ms"] = static_cast<Json::Int64>(note.elapsed.count());
        list.append(item);
    }
    return list;
}

Json::Value failure_metadata(FailureKind failure,
                             std::chrono::milliseconds retry_after,
                             const std::vector<AttemptNote>& attempts,
                             std::chrono::milliseconds elapsed)
{
    Json::Value metadata(Json::objectValue);
    metadata["failure_kind"] = to_string(failure);
    metadata["duration_ms"] = static_cast<Json::Int64>(elapsed.count());
    if (retry_after.count() > 0) {
        metadata["retry_after_ms"] = static_cast<Json::Int64>(retry_after.count());
    }
    metadata["attempts"] = attempts_to_json(attempts);
    return metadata;
}

} // namespace

ToolResult::ToolResult(bool success,
                       std::string content,
                       Json::Value artifacts,
                       std::optional<std::string> error_message,
                       Json::Value metadata)
    : success_(success)
    , content_(std::move(content))
    , artifacts_(std::move(artifacts))
    , error_message_(std::move(error_message))
    , metadata_(std::move(metadata))
{}

ToolResult ToolResult::ok(std::string content, Json::Value artifacts, Json::Value metadata)
{
    if (artifacts.isNull()) {
        artifacts = Json::Value(Json::arrayValue);
    }
    if (!artifacts.isArray()) {
        throw std::invalid_argument("ToolResult artifacts must be a JSON array");
    }
    return ToolResult(true, std::move(content), std::move(artifacts), std::nullopt,
                      normalize_metadata(std::move(metadata)));
}

ToolResult ToolResult::fail(std::string error_message, Json::Value metadata)
{
    if (error_message.empty()) {
        throw std::invalid_argument("ToolResult::fail requires an error message");
    }
    return ToolResult(false, std::string(), Json::Value(Json::arrayValue),
                      std::move(error_message), normalize_metadata(std::move(metadata)));
}

Json::Value ToolResult::to_json() const
{
    Json::Value root(Json::objectValue);
    root["success"] = success_;
    root["content"] = content_;
    root["artifacts"] = artifacts_;
    root["error_message"] = error_message_ ? Json::Value(*error_message_) : Json::Value();
    root["metadata"] = metadata_;
    return root;
}

ToolResult to_tool_result(const InvocationOutcome& outcome)
{
    if (!outcome.success) {
        Json::Value metadata = failure_metadata(outcome.failure, outcome.retry_after,
                                                outcome.attempts, outcome.elapsed);
        if (!outcome.provider_id.empty()) {
            metadata["provider"] = outcome.provider_id;
        }
        return ToolResult::fail(outcome.error_message.empty() ? std::string("Invocation failed")
                                                              : outcome.error_message,
                                std::move(metadata));
    }

    Json::Value metadata(Json::objectValue);
    metadata["provider"] = outcome.provider_id;
    metadata["model"] = outcome.model_used;
    metadata["cost_usd"] = outcome.cost;
    metadata["duration_ms"] = static_cast<Json::Int64>(outcome.elapsed.count());
    metadata["attempts"] = static_cast<Json::UInt64>(outcome.attempts.size());
    metadata["prompt_tokens"] = outcome.reply.usage.prompt_tokens;
    metadata["completion_tokens"] = outcome.reply.usage.completion_tokens;

    Json::Value artifacts(Json::arrayValue);
    for (const auto& vector : outcome.reply.embeddings) {
        Json::Value embedding(Json::objectValue);
        embedding["kind"] = "embedding";
        embedding["dimensions"] = static_cast<Json::UInt64>(vector.size());
        Json::Value values(Json::arrayValue);
        for (float v : vector) {
            values.append(static_cast<double>(v));
        }
        embedding["values"] = values;
        artifacts.append(embedding);
    }

    return ToolResult::ok(outcome.reply.text, std::move(artifacts), std::move(metadata));
}

ToolResult to_tool_result(const SearchOutcome& outcome)
{
    if (!outcome.success) {
        return ToolResult::fail(outcome.error_message.empty() ? std::string("Search failed")
                                                              : outcome.error_message,
                                failure_metadata(outcome.failure, outcome.retry_after,
                                                 outcome.attempts, outcome.elapsed));
    }

    std::ostringstream content;
    Json::Value artifacts(Json::arrayValue);
    int index = 1;
    for (const auto& hit : outcome.result.hits) {
        content << index++ << ". " << hit.title << "\n   " << hit.url << "\n";
        if (!hit.snippet.empty()) {
            content << "   " << hit.snippet << "\n";
        }

        Json::Value artifact(Json::objectValue);
        artifact["kind"] = "url";
        artifact["title"] = hit.title;
        artifact["url"] = hit.url;
        artifact["snippet"] = hit.snippet;
        if (!hit.published_date.empty()) {
            artifact["published_date"] = hit.published_date;
        }
        if (hit.relevance_score) {
            artifact["relevance_score"] = *hit.relevance_score;
        }
        artifacts.append(artifact);
    }

    Json::Value metadata(Json::objectValue);
    metadata["provider"] = outcome.result.provider_id;
    metadata["query"] = outcome.result.query;
    metadata["cache_hit"] = outcome.result.cache_hit;
    metadata["cost_usd"] = outcome.cost;
    metadata["duration_ms"] = static_cast<Json::Int64>(outcome.elapsed.count());

    return ToolResult::ok(content.str(), std::move(artifacts), std::move(metadata));
}
