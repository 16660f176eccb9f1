/*
 * HTTP transport implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpProviderBackend.hpp"
#include "FailoverSupport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

// Helper function for curl write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response)
{
    const size_t total_size = size * nmemb;
    response->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

// Captures the Retry-After header of throttled replies
size_t header_callback(char* buffer, size_t size, size_t nitems, std::string* retry_after)
{
    const size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    const std::string name = "retry-after:";
    if (line.size() > name.size()) {
        std::string prefix = line.substr(0, name.size());
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix == name) {
            std::string value = line.substr(name.size());
            const auto first = value.find_first_not_of(" \t");
            const auto last = value.find_last_not_of(" \t\r\n");
            *retry_after = first == std::string::npos ? "" : value.substr(first, last - first + 1);
        }
    }
    return total_size;
}

const char* role_name(MessageRole role)
{
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

std::string write_compact(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

bool parse_body(const std::string& body, Json::Value& root, std::string& errors)
{
    Json::CharReaderBuilder reader_builder;
    std::istringstream response_stream(body);
    return Json::parseFromStream(reader_builder, response_stream, &root, &errors);
}

std::string extract_error_message(const std::string& body)
{
    Json::Value root;
    std::string errors;
    if (parse_body(body, root, errors) && root.isObject() && root.isMember("error")) {
        const Json::Value& error = root["error"];
        if (error.isString()) {
            return error.asString();
        }
        if (error.isObject() && error.isMember("message") && error["message"].isString()) {
            return error["message"].asString();
        }
    }
    return body.substr(0, 200);
}

template <typename Reply>
bool fill_transport_failure(const HttpProviderBackend::HttpResponse& http_response, Reply& reply)
{
    reply.http_status = static_cast<int>(http_response.status_code);

    if (http_response.timed_out) {
        reply.status = ReplyStatus::Timeout;
        reply.error = "Request timed out: " + http_response.error;
        return true;
    }
    if (!http_response.error.empty() && http_response.status_code == 0) {
        reply.status = ReplyStatus::NetworkError;
        reply.error = "HTTP request failed: " + http_response.error;
        return true;
    }
    if (!http_response.success()) {
        reply.status = classify_http_status(http_response.status_code);
        reply.error = extract_error_message(http_response.body) +
                      " (status: " + std::to_string(http_response.status_code) + ")";
        reply.retry_after = HttpProviderBackend::parse_retry_after(http_response.retry_after);
        return true;
    }
    return false;
}

void read_usage(const Json::Value& root, ProviderReply& reply)
{
    if (!root.isMember("usage") || !root["usage"].isObject()) {
        return;
    }
    const Json::Value& usage = root["usage"];
    reply.usage.prompt_tokens = usage.get("prompt_tokens", 0).asInt();
    reply.usage.completion_tokens = usage.get("completion_tokens", 0).asInt();
    reply.usage.total_tokens = usage.get("total_tokens",
        reply.usage.prompt_tokens + reply.usage.completion_tokens).asInt();
    if (usage.isMember("cost") && usage["cost"].isNumeric()) {
        reply.reported_cost = usage["cost"].asDouble();
    }
}

} // namespace

HttpProviderBackend::HttpProviderBackend(HttpClient http_client, CredentialResolver credentials)
    : http_client_(std::move(http_client))
    , credentials_(std::move(credentials))
{}

std::chrono::milliseconds HttpProviderBackend::parse_retry_after(const std::string& header_value)
{
    if (header_value.empty() ||
        !std::all_of(header_value.begin(), header_value.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::seconds(std::strtol(header_value.c_str(), nullptr, 10));
}

HttpProviderBackend::PreparedCall HttpProviderBackend::prepare(const ProviderConfig& provider) const
{
    PreparedCall call;
    call.headers.emplace_back("Content-Type", "application/json");

    if (provider.credential_env.empty()) {
        return call;
    }

    std::optional<std::string> key;
    if (credentials_) {
        key = credentials_(provider.credential_env);
    } else if (const char* value = std::getenv(provider.credential_env.c_str())) {
        key = std::string(value);
    }

    if (!key || key->empty()) {
        call.error = "Credential " + provider.credential_env + " is not set";
        return call;
    }

    call.headers.emplace_back("Authorization", "Bearer " + *key);
    return call;
}

HttpProviderBackend::HttpResponse HttpProviderBackend::default_http_client(
    const std::string& url,
    const std::string& method,
    const std::string& body,
    const std::vector<std::pair<std::string, std::string>>& headers,
    int timeout_ms) const
{
    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    std::string response_body;
    std::string retry_after;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &retry_after);

    curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header.c_str());
    }

    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        result.timed_out = res == CURLE_OPERATION_TIMEDOUT;
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
        result.body = std::move(response_body);
        result.retry_after = std::move(retry_after);
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}

HttpProviderBackend::HttpResponse HttpProviderBackend::send(
    const std::string& url,
    const std::string& body,
    const std::vector<std::pair<std::string, std::string>>& headers,
    int timeout_ms) const
{
    if (http_client_) {
        return http_client_(url, "POST", body, headers, timeout_ms);
    }
    return default_http_client(url, "POST", body, headers, timeout_ms);
}

std::string HttpProviderBackend::build_chat_payload(const ProviderConfig& provider,
                                                    const InvocationRequest& request) const
{
    Json::Value payload(Json::objectValue);
    payload["model"] = provider.model;
    payload["stream"] = false;
    payload["temperature"] = request.temperature;
    if (request.max_tokens > 0) {
        payload["max_tokens"] = request.max_tokens;
    }

    Json::Value messages(Json::arrayValue);
    for (const auto& msg : request.messages) {
        Json::Value item(Json::objectValue);
        item["role"] = role_name(msg.role);
        item["content"] = msg.content;
        messages.append(item);
    }
    payload["messages"] = messages;

    return write_compact(payload);
}

std::string HttpProviderBackend::build_embedding_payload(const ProviderConfig& provider,
                                                         const InvocationRequest& request) const
{
    Json::Value payload(Json::objectValue);
    payload["model"] = provider.model;

    Json::Value input(Json::arrayValue);
    for (const auto& text : request.embedding_inputs) {
        input.append(text);
    }
    payload["input"] = input;

    return write_compact(payload);
}

std::string HttpProviderBackend::build_search_payload(const SearchQuery& query) const
{
    Json::Value payload(Json::objectValue);
    payload["query"] = query.query;
    payload["count"] = std::clamp(query.count, 1, 25);
    if (!query.domains.empty()) {
        Json::Value domains(Json::arrayValue);
        for (const auto& domain : query.domains) {
            domains.append(domain);
        }
        payload["domains"] = domains;
    }
    if (!query.recency.empty()) {
        payload["recency"] = query.recency;
    }
    return write_compact(payload);
}

ProviderReply HttpProviderBackend::parse_chat_response(const HttpResponse& http_response) const
{
    ProviderReply reply;
    if (fill_transport_failure(http_response, reply)) {
        return reply;
    }

    Json::Value root;
    std::string errors;
    if (!parse_body(http_response.body, root, errors) || !root.isObject()) {
        reply.status = ReplyStatus::ServerError;
        reply.error = "Failed to parse JSON response: " + errors;
        return reply;
    }

    const Json::Value& choices = root["choices"];
    if (choices.isArray() && !choices.empty() &&
        choices[0].isMember("message") && choices[0]["message"].isMember("content")) {
        const Json::Value& content = choices[0]["message"]["content"];
        reply.text = content.isString() ? content.asString() : std::string();
        reply.status = ReplyStatus::Ok;
    } else if (root.isMember("error")) {
        reply.status = ReplyStatus::ServerError;
        reply.error = extract_error_message(http_response.body);
    } else {
        reply.status = ReplyStatus::ServerError;
        reply.error = "Unexpected response format";
    }

    read_usage(root, reply);
    return reply;
}

ProviderReply HttpProviderBackend::parse_embedding_response(const HttpResponse& http_response) const
{
    ProviderReply reply;
    if (fill_transport_failure(http_response, reply)) {
        return reply;
    }

    Json::Value root;
    std::string errors;
    if (!parse_body(http_response.body, root, errors) || !root.isObject() ||
        !root["data"].isArray()) {
        reply.status = ReplyStatus::ServerError;
        reply.error = errors.empty() ? "Unexpected response format"
                                     : "Failed to parse JSON response: " + errors;
        return reply;
    }

    for (const auto& item : root["data"]) {
        std::vector<float> vector;
        for (const auto& v : item["embedding"]) {
            vector.push_back(v.asFloat());
        }
        reply.embeddings.push_back(std::move(vector));
    }

    reply.status = ReplyStatus::Ok;
    read_usage(root, reply);
    return reply;
}

SearchReply HttpProviderBackend::parse_search_response(const HttpResponse& http_response) const
{
    SearchReply reply;
    if (fill_transport_failure(http_response, reply)) {
        return reply;
    }

    Json::Value root;
    std::string errors;
    if (!parse_body(http_response.body, root, errors) || !root.isObject()) {
        reply.status = ReplyStatus::ServerError;
        reply.error = "Failed to parse JSON response: " + errors;
        return reply;
    }

    for (const auto& item : root["results"]) {
        SearchHit hit;
        hit.title = item.get("title", "").asString();
        hit.url = item.get("url", "").asString();
        hit.snippet = item.get("snippet", "").asString();
        if (item["published_date"].isString()) {
            hit.published_date = item["published_date"].asString();
        }
        if (item["relevance_score"].isNumeric()) {
            hit.relevance_score = item["relevance_score"].asDouble();
        }
        reply.hits.push_back(std::move(hit));
    }

    if (root.isMember("cost") && root["cost"].isNumeric()) {
        reply.reported_cost = root["cost"].asDouble();
    }

    reply.status = ReplyStatus::Ok;
    return reply;
}

ProviderReply HttpProviderBackend::complete(const ProviderConfig& provider,
                                            const InvocationRequest& request) const
{
    PreparedCall call = prepare(provider);
    if (!call.error.empty()) {
        ProviderReply reply;
        reply.status = ReplyStatus::AuthError;
        reply.error = call.error;
        return reply;
    }

    std::string url = provider.base_url;
    // Remove trailing slash if present
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    const bool embedding = request.capability == ProviderCapability::Embedding;
    url += embedding ? kEmbeddingsEndpoint : kChatEndpoint;
    const std::string payload = embedding ? build_embedding_payload(provider, request)
                                          : build_chat_payload(provider, request);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("POST {} (provider {}, timeout {}ms)", url, provider.id, request.timeout_ms);
    }

    const HttpResponse http_response = send(url, payload, call.headers, request.timeout_ms);
    return embedding ? parse_embedding_response(http_response) : parse_chat_response(http_response);
}

SearchReply HttpProviderBackend::search(const ProviderConfig& provider, const SearchQuery& query) const
{
    PreparedCall call = prepare(provider);
    if (!call.error.empty()) {
        SearchReply reply;
        reply.status = ReplyStatus::AuthError;
        reply.error = call.error;
        return reply;
    }

    if (auto logger = Logger::get_logger("search_logger")) {
        logger->debug("POST {} (provider {}, query '{}')", provider.base_url, provider.id, query.query);
    }

    const HttpResponse http_response = send(provider.base_url, build_search_payload(query),
                                            call.headers, query.timeout_ms);
    return parse_search_response(http_response);
}
