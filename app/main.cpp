/*
 * Command line front end for the gateway
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CitationValidator.hpp"
#include "GatewayConfig.hpp"
#include "GatewayFactory.hpp"
#include "Logger.hpp"
#include "ToolResult.hpp"

#include <curl/curl.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConfig = 3;

constexpr const char* kUsage =
    "Usage:\n"
    "  civic-gateway --config FILE complete --prompt TEXT [--system TEXT] [--step NAME]\n"
    "                [--max-tokens N] [--source FILE]\n"
    "  civic-gateway --config FILE search --query TEXT [--count N] [--domain D]... [--recency R]\n";

struct CliOptions {
    std::string config_path;
    std::string command;
    std::string prompt;
    std::string system_prompt;
    std::string step;
    std::string source_path;
    int max_tokens{1024};
    SearchQuery search;
};

std::optional<int> parse_positive(const std::string& text)
{
    int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<CliOptions> parse_arguments(int argc, char* argv[], std::string& error)
{
    CliOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "complete" || arg == "search") {
            options.command = arg;
            continue;
        }

        if (i + 1 >= args.size()) {
            error = "Missing value for " + arg;
            return std::nullopt;
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--prompt") {
            options.prompt = value;
        } else if (arg == "--system") {
            options.system_prompt = value;
        } else if (arg == "--step") {
            options.step = value;
            options.search.step = value;
        } else if (arg == "--source") {
            options.source_path = value;
        } else if (arg == "--query") {
            options.search.query = value;
        } else if (arg == "--domain") {
            options.search.domains.push_back(value);
        } else if (arg == "--recency") {
            options.search.recency = value;
        } else if (arg == "--max-tokens" || arg == "--count") {
            const auto number = parse_positive(value);
            if (!number) {
                error = "Invalid number for " + arg;
                return std::nullopt;
            }
            if (arg == "--count") {
                options.search.count = *number;
            } else {
                options.max_tokens = *number;
            }
        } else {
            error = "Unknown argument: " + arg;
            return std::nullopt;
        }
    }

    if (options.config_path.empty()) {
        error = "--config is required";
        return std::nullopt;
    }
    if (options.command.empty()) {
        error = "A command (complete or search) is required";
        return std::nullopt;
    }
    if (options.command == "complete" && options.prompt.empty()) {
        error = "complete requires --prompt";
        return std::nullopt;
    }
    if (options.command == "search" && options.search.query.empty()) {
        error = "search requires --query";
        return std::nullopt;
    }
    return options;
}

std::optional<std::string> read_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

int run(const CliOptions& options, const Gateway& gateway)
{
    Json::Value output(Json::objectValue);
    bool success = false;

    if (options.command == "complete") {
        InvocationRequest request;
        request.capability = ProviderCapability::Completion;
        request.max_tokens = options.max_tokens;
        request.step = options.step;
        if (!options.system_prompt.empty()) {
            request.messages.push_back({MessageRole::System, options.system_prompt});
        }
        request.messages.push_back({MessageRole::User, options.prompt});

        const ToolResult result = to_tool_result(gateway.llm->invoke(request));
        success = result.success();
        output["result"] = result.to_json();

        if (success && !options.source_path.empty()) {
            const auto source = read_file(options.source_path);
            if (!source) {
                std::cerr << "Cannot read source file: " << options.source_path << "\n";
                return kExitUsage;
            }
            Json::Value warnings(Json::arrayValue);
            for (const auto& warning :
                 CitationValidator::validate_citations(result.content(), *source)) {
                warnings.append(warning);
            }
            output["citation_warnings"] = warnings;
        }
    } else {
        const ToolResult result = to_tool_result(gateway.search->search(options.search));
        success = result.success();
        output["result"] = result.to_json();
    }

    output["costs"] = gateway.cost_tracker->summary_json();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, output) << std::endl;

    return success ? kExitOk : kExitFailed;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string error;
    const auto options = parse_arguments(argc, argv, error);
    if (!options) {
        std::cerr << error << "\n\n" << kUsage;
        return kExitUsage;
    }

    GatewayConfig config;
    try {
        config = load_gateway_config(options->config_path);
    } catch (const GatewayConfigError& ex) {
        std::cerr << ex.what() << "\n";
        return kExitConfig;
    }

    Logger::setup_loggers(config.log_level, config.log_file);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = kExitFailed;
    try {
        const Gateway gateway = GatewayFactory::create_from_config(config);
        exit_code = run(*options, gateway);
    } catch (const GatewayConfigError& ex) {
        std::cerr << ex.what() << "\n";
        exit_code = kExitConfig;
    }

    curl_global_cleanup();
    return exit_code;
}
