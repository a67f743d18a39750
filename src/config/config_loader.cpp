#include <toolmux/config/config_loader.hpp>

#include <toolmux/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <unordered_set>

namespace toolmux {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, ErrorCategory::Config};
}

// Build an EndpointConfig from one `servers:` entry.
Result<EndpointConfig, Error> ParseYamlEndpoint(const std::string& alias,
                                                const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<EndpointConfig, Error>::Err(
            MakeConfigError("Server '" + alias + "' must be a mapping"));
    }
    const bool has_url = static_cast<bool>(node["url"]);
    const bool has_command = static_cast<bool>(node["command"]);
    if (has_url && has_command) {
        return Result<EndpointConfig, Error>::Err(
            MakeConfigError("Server '" + alias +
                            "' sets both 'url' and 'command'; exactly one is allowed"));
    }
    if (!has_url && !has_command) {
        return Result<EndpointConfig, Error>::Err(
            MakeConfigError("Server '" + alias + "' needs either 'url' or 'command'"));
    }

    if (has_url) {
        return Result<EndpointConfig, Error>::Ok(
            EndpointConfig{alias, SseTransport{node["url"].as<std::string>()}});
    }

    StdioTransport stdio;
    stdio.command = node["command"].as<std::string>();
    if (node["args"]) {
        if (!node["args"].IsSequence()) {
            return Result<EndpointConfig, Error>::Err(
                MakeConfigError("Server '" + alias + "': 'args' must be a list"));
        }
        for (const auto& arg : node["args"]) {
            stdio.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        if (!node["env"].IsMap()) {
            return Result<EndpointConfig, Error>::Err(
                MakeConfigError("Server '" + alias + "': 'env' must be a mapping"));
        }
        for (const auto& kv : node["env"]) {
            stdio.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    return Result<EndpointConfig, Error>::Ok(EndpointConfig{alias, std::move(stdio)});
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;
    config.client = DefaultClientIdentity();

    // -- Servers --
    if (root["servers"]) {
        const auto& servers = root["servers"];
        if (!servers.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("'servers' must map aliases to server entries"));
        }
        for (const auto& kv : servers) {
            auto endpoint = ParseYamlEndpoint(kv.first.as<std::string>(), kv.second);
            if (endpoint.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(endpoint).Error());
            }
            config.endpoints.push_back(std::move(endpoint).Value());
        }
    }

    // -- Client identity --
    if (root["client"]) {
        const auto& client = root["client"];
        if (client["name"]) {
            config.client.name = client["name"].as<std::string>();
        }
        if (client["version"]) {
            config.client.version = client["version"].as<std::string>();
        }
    }

    // -- Options --
    if (root["timeout"]) {
        config.timeout_seconds = root["timeout"].as<int>();
    }
    if (root["notification_queue"]) {
        config.notification_queue_capacity = root["notification_queue"].as<int>();
    }
    if (root["indent"]) {
        config.report_indent = root["indent"].as<std::string>();
    }
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["json_output"]) {
        config.json_output = root["json_output"].as<bool>();
    }
    if (root["verbose"]) {
        config.verbose = root["verbose"].as<bool>();
    }
    if (root["quiet"]) {
        config.quiet = root["quiet"].as<bool>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

ClientIdentity DefaultClientIdentity() {
    return ClientIdentity{"toolmux", kVersion};
}

// ---------------------------------------------------------------------------
// ParseServerSpec
// ---------------------------------------------------------------------------
Result<EndpointConfig, Error> ParseServerSpec(std::string_view spec) {
    auto eq = spec.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == spec.size()) {
        return Result<EndpointConfig, Error>::Err(
            MakeConfigError("Invalid --server '" + std::string(spec) +
                            "', expected NAME=URL"));
    }
    return Result<EndpointConfig, Error>::Ok(EndpointConfig{
        std::string(spec.substr(0, eq)),
        SseTransport{std::string(spec.substr(eq + 1))}});
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    try {
        return ParseYamlRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // --version and -v are handled by main; only --help is built in here.
    argparse::ArgumentParser program("toolmux", kVersion,
                                     argparse::default_arguments::help);

    // Endpoints
    program.add_argument("--baseurl")
        .help("SSE endpoint URL, registered under the alias 'default'");
    program.add_argument("--server")
        .help("Additional SSE endpoint as NAME=URL (repeatable)")
        .append();

    // Invocation
    program.add_argument("--tool")
        .help("Tool to call, as ALIAS.NAME");
    program.add_argument("--args")
        .help("Tool arguments as a JSON object");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout")
        .help("Overall timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.client = DefaultClientIdentity();

    // Endpoints
    if (auto val = program.present("--baseurl")) {
        config.endpoints.push_back(EndpointConfig{"default", SseTransport{*val}});
    }
    if (auto specs = program.present<std::vector<std::string>>("--server")) {
        for (const auto& spec : *specs) {
            auto endpoint = ParseServerSpec(spec);
            if (endpoint.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(endpoint).Error());
            }
            config.endpoints.push_back(std::move(endpoint).Value());
        }
    }

    // Invocation
    if (auto val = program.present("--tool")) {
        config.tool = *val;
    }
    if (auto val = program.present("--args")) {
        config.args_json = *val;
    }

    // Options
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // CLI endpoints replace same-alias YAML entries in place, others append.
    for (const auto& endpoint : cli_overrides.endpoints) {
        auto it = std::find_if(merged.endpoints.begin(), merged.endpoints.end(),
                               [&](const EndpointConfig& e) {
                                   return e.name == endpoint.name;
                               });
        if (it != merged.endpoints.end()) {
            *it = endpoint;
        } else {
            merged.endpoints.push_back(endpoint);
        }
    }

    // Invocation
    if (cli_overrides.tool.has_value()) {
        merged.tool = cli_overrides.tool;
    }
    if (cli_overrides.args_json.has_value()) {
        merged.args_json = cli_overrides.args_json;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.timeout_seconds.has_value()) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.endpoints.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "At least one server must be configured (--baseurl, --server or -c)"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& endpoint : config.endpoints) {
        if (endpoint.name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server alias must not be empty"));
        }
        if (endpoint.name.find('.') != std::string::npos) {
            return Result<void, Error>::Err(
                MakeConfigError("Server alias '" + endpoint.name +
                                "' must not contain '.'"));
        }
        if (!seen.insert(endpoint.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate server alias: " + endpoint.name));
        }
    }

    if (config.timeout_seconds.has_value() && *config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(*config.timeout_seconds)));
    }
    if (config.notification_queue_capacity <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Notification queue capacity must be positive, got " +
                            std::to_string(config.notification_queue_capacity)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolmux
