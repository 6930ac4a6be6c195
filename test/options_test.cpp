#include "../app/options.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace convgate::app;

namespace {

int check(bool condition, const char* message)
{
    if (condition)
        return 0;
    std::fprintf(stderr, "[FAIL] %s\n", message);
    return 1;
}

ParseOutcome parse(std::vector<std::string> args, ProxyOptions& options, std::string& error)
{
    args.insert(args.begin(), "convgate");
    std::vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data(), options, error);
}

} // namespace

int main()
{
    int failures = 0;

    {
        ProxyOptions options;
        std::string  error;
        failures += check(parse({}, options, error) == ParseOutcome::Run, "no arguments is a plain run");
        failures += check(options.port == 8080 && options.host == "0.0.0.0", "listen defaults");
        failures += check(options.origin == "https://chat.openai.com", "origin default");
        failures += check(options.puid_ttl == std::chrono::seconds(3600), "puid ttl default");
        failures += check(options.verify_peer && !options.arkose_gpt3_experiment, "flag defaults");
    }
    {
        ProxyOptions options;
        std::string  error;
        auto         outcome = parse({ "--host", "127.0.0.1", "--port", "9000", "--origin", "http://127.0.0.1:7000/",
                                       "--arkose-endpoint", "http://solver/token", "--arkose-gpt3-experiment",
                                       "--puid-ttl", "60", "--insecure", "--verbose", "--threads", "2", "--log-append" },
                                     options, error);
        failures += check(outcome == ParseOutcome::Run, "full flag set parses");
        failures += check(options.host == "127.0.0.1" && options.port == 9000, "listen address");
        failures += check(options.origin == "http://127.0.0.1:7000", "origin trailing slash trimmed");
        failures += check(options.arkose_endpoint == "http://solver/token", "solver endpoint");
        failures += check(options.arkose_gpt3_experiment, "experiment flag");
        failures += check(options.puid_ttl == std::chrono::seconds(60), "ttl flag");
        failures += check(!options.verify_peer, "insecure flag");
        failures += check(options.log_level == spdlog::level::debug, "verbose flag");
        failures += check(options.threads == 2 && !options.log_truncate, "threads and log append");
    }
    {
        ProxyOptions options;
        std::string  error;
        failures += check(parse({ "--port", "70000" }, options, error) == ParseOutcome::Error, "port out of range");
        failures += check(!error.empty(), "error message set");
        failures += check(parse({ "--port" }, options, error) == ParseOutcome::Error, "missing value");
        failures += check(parse({ "--origin", "chat.openai.com" }, options, error) == ParseOutcome::Error,
                          "origin without scheme");
        failures += check(parse({ "--bogus" }, options, error) == ParseOutcome::Error, "unknown flag");
        failures += check(parse({ "--puid-ttl", "abc" }, options, error) == ParseOutcome::Error, "non-numeric ttl");
        failures += check(parse({ "--help" }, options, error) == ParseOutcome::Help, "help");
    }
    {
        ProxyOptions   options;
        std::string    error;
        nlohmann::json config = { { "port", 8443 }, { "api-origin", "https://api.example" }, { "quiet", true },
                                  { "arkose-gpt3-experiment", true } };
        failures += check(apply_config(config, options, error), "config object applies");
        failures += check(options.port == 8443 && options.api_origin == "https://api.example", "config values");
        failures += check(options.log_level == spdlog::level::warn && options.arkose_gpt3_experiment, "config flags");
        failures += check(!apply_config(nlohmann::json { { "colour", true } }, options, error), "unknown key rejected");
        failures += check(!apply_config(nlohmann::json { { "port", true } }, options, error), "wrong type rejected");
        failures += check(!apply_config(nlohmann::json::array(), options, error), "non-object rejected");
    }
    {
        auto path = std::filesystem::temp_directory_path() / "convgate_options_test.json";
        {
            std::ofstream out(path);
            out << "{\n  // local overrides\n  \"port\": 9100,\n  \"origin\": \"https://upstream.example\"\n}\n";
        }
        ProxyOptions options;
        std::string  error;
        auto         outcome = parse({ "--config", path.string(), "--port", "9200" }, options, error);
        failures += check(outcome == ParseOutcome::Run, "config file loads");
        failures += check(options.origin == "https://upstream.example", "config file value applied");
        failures += check(options.port == 9200, "later flag overrides the config file");
        std::error_code ec;
        std::filesystem::remove(path, ec);

        failures += check(parse({ "--config", "/nonexistent/convgate.json" }, options, error) == ParseOutcome::Error,
                          "missing config file");
    }

    if (failures == 0)
        std::fprintf(stdout, "options_test: all checks passed\n");
    return failures == 0 ? 0 : 1;
}
