#include "options.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdio>
#include <fstream>
#include <string_view>

namespace convgate::app {

namespace {

    bool parse_int(std::string_view text, long long min_value, long long max_value, long long& out)
    {
        if (text.empty())
            return false;
        long long value = 0;
        auto [ptr, ec]  = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return false;
        if (value < min_value || value > max_value)
            return false;
        out = value;
        return true;
    }

    bool valid_origin(const std::string& origin)
    {
        return origin.rfind("http://", 0) == 0 || origin.rfind("https://", 0) == 0;
    }

    void strip_trailing_slashes(std::string& origin)
    {
        while (!origin.empty() && origin.back() == '/')
            origin.pop_back();
    }

    bool set_port(std::string_view text, ProxyOptions& options, std::string& error)
    {
        long long value = 0;
        if (!parse_int(text, 1, 65535, value)) {
            error = "invalid port: " + std::string(text);
            return false;
        }
        options.port = static_cast<uint16_t>(value);
        return true;
    }

    bool set_ttl(std::string_view text, ProxyOptions& options, std::string& error)
    {
        long long value = 0;
        if (!parse_int(text, 1, 7 * 24 * 3600, value)) {
            error = "invalid puid ttl: " + std::string(text);
            return false;
        }
        options.puid_ttl = std::chrono::seconds(value);
        return true;
    }

    bool set_threads(std::string_view text, ProxyOptions& options, std::string& error)
    {
        long long value = 0;
        if (!parse_int(text, 0, 1024, value)) {
            error = "invalid thread count: " + std::string(text);
            return false;
        }
        options.threads = static_cast<int>(value);
        return true;
    }

    bool set_origin(std::string value, std::string& target, const char* what, std::string& error)
    {
        strip_trailing_slashes(value);
        if (!valid_origin(value)) {
            error = std::string("invalid ") + what + ": " + value;
            return false;
        }
        target = std::move(value);
        return true;
    }

    // Applies a flag that takes a value; shared by argv and the config file.
    bool apply_valued(std::string_view name, const std::string& value, ProxyOptions& options, std::string& error)
    {
        if (name == "host") {
            options.host = value;
        } else if (name == "port") {
            return set_port(value, options, error);
        } else if (name == "origin") {
            return set_origin(value, options.origin, "origin", error);
        } else if (name == "api-origin") {
            return set_origin(value, options.api_origin, "api origin", error);
        } else if (name == "arkose-endpoint") {
            options.arkose_endpoint = value;
        } else if (name == "puid-ttl") {
            return set_ttl(value, options, error);
        } else if (name == "log-file") {
            options.log_file = value;
        } else if (name == "threads") {
            return set_threads(value, options, error);
        } else {
            error = "unknown option: " + std::string(name);
            return false;
        }
        return true;
    }

    bool is_valued(std::string_view name)
    {
        return name == "host" || name == "port" || name == "origin" || name == "api-origin"
            || name == "arkose-endpoint" || name == "puid-ttl" || name == "log-file" || name == "threads";
    }

} // namespace

bool apply_config(const nlohmann::json& config, ProxyOptions& options, std::string& error)
{
    if (!config.is_object()) {
        error = "config must be a JSON object";
        return false;
    }
    for (auto it = config.begin(); it != config.end(); ++it) {
        const std::string& key   = it.key();
        const auto&        value = it.value();
        if (is_valued(key)) {
            std::string text;
            if (value.is_string())
                text = value.get<std::string>();
            else if (value.is_number_integer())
                text = std::to_string(value.get<long long>());
            else {
                error = "config key " + key + " must be a string or integer";
                return false;
            }
            if (!apply_valued(key, text, options, error))
                return false;
            continue;
        }
        if (!value.is_boolean()) {
            error = "config key " + key + " must be a boolean";
            return false;
        }
        bool flag = value.get<bool>();
        if (key == "arkose-gpt3-experiment") {
            options.arkose_gpt3_experiment = flag;
        } else if (key == "insecure") {
            options.verify_peer = !flag;
        } else if (key == "log-append") {
            options.log_truncate = !flag;
        } else if (key == "verbose") {
            if (flag)
                options.log_level = spdlog::level::debug;
        } else if (key == "quiet") {
            if (flag)
                options.log_level = spdlog::level::warn;
        } else {
            error = "unknown config key: " + key;
            return false;
        }
    }
    return true;
}

bool load_config_file(const std::string& path, ProxyOptions& options, std::string& error)
{
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file " + path;
        return false;
    }
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(in, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        error = "invalid config file " + path + ": " + ex.what();
        return false;
    }
    return apply_config(config, options, error);
}

ParseOutcome parse_options(int argc, char* argv[], ProxyOptions& options, std::string& error)
{
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "-h" || arg == "--help")
            return ParseOutcome::Help;
        if (arg.rfind("--", 0) != 0) {
            error = "unexpected argument: " + std::string(arg);
            return ParseOutcome::Error;
        }
        std::string_view name = arg.substr(2);

        if (name == "config" || is_valued(name)) {
            if (i + 1 >= argc) {
                error = "missing value for " + std::string(arg);
                return ParseOutcome::Error;
            }
            std::string value = argv[++i];
            bool        ok    = (name == "config") ? load_config_file(value, options, error)
                                                   : apply_valued(name, value, options, error);
            if (!ok)
                return ParseOutcome::Error;
        } else if (name == "arkose-gpt3-experiment") {
            options.arkose_gpt3_experiment = true;
        } else if (name == "insecure") {
            options.verify_peer = false;
        } else if (name == "log-append") {
            options.log_truncate = false;
        } else if (name == "verbose") {
            options.log_level = spdlog::level::debug;
        } else if (name == "quiet") {
            options.log_level = spdlog::level::warn;
        } else {
            error = "unknown option: " + std::string(arg);
            return ParseOutcome::Error;
        }
    }
    return ParseOutcome::Run;
}

void print_usage(const char* program)
{
    std::fprintf(stdout,
                 "Usage: %s [options]\n"
                 "  --host <addr>               listen address (default 0.0.0.0)\n"
                 "  --port <port>               listen port (default 8080)\n"
                 "  --origin <url>              upstream origin requests are forwarded to\n"
                 "  --api-origin <url>          origin for sentinel and session id lookups\n"
                 "  --arkose-endpoint <url>     challenge token solver\n"
                 "  --arkose-gpt3-experiment    require challenge tokens for gpt-3.5 models too\n"
                 "  --puid-ttl <seconds>        session id cache lifetime (default 3600)\n"
                 "  --insecure                  do not verify upstream TLS certificates\n"
                 "  --threads <n>               worker threads (0 = hardware concurrency)\n"
                 "  --log-file <path>           also log to a file\n"
                 "  --log-append                append to the log file instead of truncating\n"
                 "  --verbose | --quiet         debug or warning log level\n"
                 "  --config <file.json>        load options from a JSON file\n",
                 program);
}

} // namespace convgate::app
