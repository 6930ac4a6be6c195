#pragma once

#include <spdlog/common.h>

#include <nlohmann/json_fwd.hpp>

#include "../proxy/constants.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace convgate::app {

struct ProxyOptions {
    std::string               host { "0.0.0.0" };
    uint16_t                  port { 8080 };
    std::string               origin { proxy::kDefaultOrigin };
    std::string               api_origin { proxy::kDefaultApiOrigin };
    std::string               arkose_endpoint;
    bool                      arkose_gpt3_experiment { false };
    std::chrono::seconds      puid_ttl { 3600 };
    bool                      verify_peer { true };
    std::string               log_file;
    bool                      log_truncate { true };
    spdlog::level::level_enum log_level { spdlog::level::info };
    int                       threads { 0 }; // 0 = hardware concurrency
};

enum class ParseOutcome {
    Run,
    Help,
    Error,
};

/**
 * @brief Parse command line flags into @p options. `--config <file>` is applied where it appears,
 * so flags after it override the file.
 */
ParseOutcome parse_options(int argc, char* argv[], ProxyOptions& options, std::string& error);

/**
 * @brief Apply a JSON object whose keys mirror the long flag names (`"port": 8080`,
 * `"arkose-endpoint": "..."`). Unknown keys are rejected.
 */
bool apply_config(const nlohmann::json& config, ProxyOptions& options, std::string& error);

bool load_config_file(const std::string& path, ProxyOptions& options, std::string& error);

void print_usage(const char* program);

} // namespace convgate::app
