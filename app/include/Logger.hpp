/*
 * spdlog setup and lookup helpers
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

class Logger {
public:
    /**
     * Create the shared loggers used by the gateway.
     * @param level spdlog level name ("trace", "debug", "info", "warn", "error", "off")
     * @param log_file Optional rotating log file; empty logs to the console only
     */
    static void setup_loggers(const std::string& level = "info",
                              const std::string& log_file = "");

    /**
     * Look up a registered logger. Returns nullptr before setup_loggers().
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
};

#endif // LOGGER_HPP
