#include <toolmux/cli/output_formatter.hpp>
#include <toolmux/cli/response_formatter.hpp>
#include <toolmux/config/config_loader.hpp>
#include <toolmux/core/deadline.hpp>
#include <toolmux/core/log.hpp>
#include <toolmux/core/terminal.hpp>
#include <toolmux/core/version.hpp>
#include <toolmux/orchestrator/orchestrator.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

enum class Subcommand {
    List,
    Call,
};

struct SubcommandParse {
    Subcommand cmd;
    bool found_subcommand;
};

SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Subcommand::List, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "list") {
        return {Subcommand::List, true};
    }
    if (arg1 == "call") {
        return {Subcommand::Call, true};
    }
    // Not a subcommand; flags for the default "list" command.
    return {Subcommand::List, false};
}

// Build argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "toolmux " << toolmux::kVersion << "\n";
            return true;
        }
    }
    return false;
}

void PrintHelp(std::ostream& out) {
    out << "toolmux " << toolmux::kVersion
        << " - route tool calls across several MCP endpoints\n"
           "\n"
           "Usage:\n"
           "  toolmux [list] [options]              list tools of every endpoint\n"
           "  toolmux call --tool ALIAS.NAME [--args JSON] [options]\n"
           "\n"
           "Endpoints:\n"
           "  -c, --config FILE     YAML config with a 'servers:' mapping\n"
           "  --baseurl URL         SSE endpoint registered as 'default'\n"
           "  --server NAME=URL     additional SSE endpoint (repeatable)\n"
           "\n"
           "Options:\n"
           "  --tool ALIAS.NAME     tool to call\n"
           "  --args JSON           tool arguments as a JSON object (default {})\n"
           "  --timeout SECONDS     overall time budget (default 90)\n"
           "  --json                machine-readable output\n"
           "  --log-file FILE       also write JSON log lines to FILE\n"
           "  -v, --verbose         debug logging\n"
           "  -q, --quiet           errors only\n"
           "  --version             print version\n"
           "  -h, --help            print this help\n";
}

bool HandleHelpFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") {
            PrintHelp(std::cout);
            return true;
        }
    }
    return false;
}

// -c/--config is consumed here rather than stored in AppConfig.
std::string FindConfigPath(const std::vector<const char*>& args) {
    for (size_t i = 1; i < args.size(); ++i) {
        auto arg = std::string_view{args[i]};
        if ((arg == "-c" || arg == "--config") && i + 1 < args.size()) {
            return args[i + 1];
        }
        if (arg.substr(0, 9) == "--config=") {
            return std::string(arg.substr(9));
        }
    }
    return {};
}

toolmux::LogLevel LevelFor(bool verbose, bool quiet) {
    if (verbose) return toolmux::LogLevel::Debug;
    if (quiet) return toolmux::LogLevel::Error;
    return toolmux::LogLevel::Info;
}

// Console sink on stderr, plus JSON lines to log_file when configured.
void ConfigureLogging(const toolmux::AppConfig& config, bool use_color) {
    using namespace toolmux;
    std::unique_ptr<ILogSink> console;
    if (config.json_output) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(use_color);
    }

    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), LevelFor(config.verbose, config.quiet));
        return;
    }

    auto file = std::make_unique<FileSink>(*config.log_file);
    const bool file_ok = file->IsOpen();
    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(console));
    if (file_ok) {
        sinks.push_back(std::move(file));
    }
    InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)),
                     LevelFor(config.verbose, config.quiet));
    if (!file_ok) {
        LogWarn("config", "Cannot open log file '" + *config.log_file + "'");
    }
}

int RunList(const toolmux::Orchestrator& orchestrator,
            const toolmux::OutputFormatter& fmt) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(orchestrator.ToolsAsJson().dump(2));
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& record : orchestrator.Registry()) {
        for (const auto& tool : record.tools) {
            auto description = tool.description.substr(0, tool.description.find('\n'));
            // Mark tools whose name is routed to a later endpoint.
            auto owner = orchestrator.ResolveEndpoint(tool.name);
            auto routed = owner.has_value() && *owner == record.name ? "yes" : "shadowed";
            rows.push_back({record.name, tool.name, routed, description});
        }
    }
    fmt.PrintTable({"Endpoint", "Tool", "Routed", "Description"}, rows);
    return kExitSuccess;
}

int RunCall(const toolmux::Orchestrator& orchestrator,
            const toolmux::AppConfig& config,
            const nlohmann::json& arguments,
            const toolmux::Deadline& deadline,
            const toolmux::OutputFormatter& fmt) {
    using namespace toolmux;
    auto result = orchestrator.CallTool(*config.tool, arguments, deadline);
    if (result.IsErr()) {
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ToJson(result.Value()).dump(2));
        return kExitSuccess;
    }
    auto tool_name = ToolNameFromIdentifier(*config.tool);
    fmt.PrintText(FormatCallReport(tool_name.IsOk() ? tool_name.Value() : *config.tool,
                                   result.Value(), config.report_indent));
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolmux;

    if (argc == 1) {
        PrintHelp(std::cout);
        return kExitSuccess;
    }
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }
    if (HandleHelpFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Logging is usable before the config is loaded; ConfigureLogging
    // replaces this sink once all settings are known.
    bool early_verbose = false;
    bool early_quiet = false;
    bool early_json = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-v" || arg == "--verbose") early_verbose = true;
        if (arg == "-q" || arg == "--quiet") early_quiet = true;
        if (arg == "--json") early_json = true;
    }
    const bool log_color = !NoColorEnvSet() && IsStderrTty();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(log_color),
                     LevelFor(early_verbose, early_quiet));

    // Step 1: subcommand.
    auto [subcommand, has_subcommand] = ParseSubcommand(argc, argv);
    auto stripped = StripSubcommand(argc, argv, has_subcommand);
    auto stripped_argc = static_cast<int>(stripped.size());

    const bool table_color = !NoColorEnvSet() && IsStdoutTty();
    OutputFormatter early_fmt(early_json, table_color);

    // Step 2: CLI flags.
    auto cli_result = LoadFromCli(stripped_argc, stripped.data());
    if (cli_result.IsErr()) {
        early_fmt.PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    // Step 3: YAML config if -c/--config was given, merged with CLI.
    AppConfig config;
    auto config_path = FindConfigPath(stripped);
    if (!config_path.empty()) {
        auto yaml_result = LoadFromYaml(config_path);
        if (yaml_result.IsErr()) {
            early_fmt.PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    // Step 4: validate.
    OutputFormatter fmt(config.json_output, table_color);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        fmt.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (subcommand == Subcommand::Call) {
        if (!config.tool.has_value() || config.tool->empty()) {
            Error error{"call", "", std::nullopt, "--tool ALIAS.NAME is required",
                        ErrorCategory::Config};
            fmt.PrintError(error);
            return error.ExitCode();
        }
        const std::string args_json = config.args_json.value_or(kDefaultArgsJson);
        arguments = nlohmann::json::parse(args_json, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object()) {
            Error error{"call", "", std::nullopt,
                        "--args must be a JSON object, got: " + args_json,
                        ErrorCategory::Config};
            fmt.PrintError(error);
            return error.ExitCode();
        }
    }

    ConfigureLogging(config, log_color);

    // Step 5: one shared deadline for the whole invocation.
    auto deadline = Deadline::AfterSeconds(
        config.timeout_seconds.value_or(kDefaultTimeoutSeconds));
    Orchestrator orchestrator(config.client, MakeSession,
                              static_cast<size_t>(config.notification_queue_capacity));

    auto opened = orchestrator.Open(config.endpoints, deadline);
    orchestrator.DrainNotifications();
    if (opened.IsErr()) {
        fmt.PrintError(opened.Error());
        orchestrator.Close();
        return opened.Error().ExitCode();
    }

    // Step 6: run the command.
    int exit_code = kExitSuccess;
    switch (subcommand) {
        case Subcommand::List:
            exit_code = RunList(orchestrator, fmt);
            break;
        case Subcommand::Call:
            exit_code = RunCall(orchestrator, config, arguments, deadline, fmt);
            break;
    }

    orchestrator.DrainNotifications();
    auto report = orchestrator.Close();
    if (!report.Ok()) {
        LogWarn("orchestrator", std::to_string(report.failures.size()) +
                                    " endpoint(s) failed to close cleanly");
    }
    return exit_code;
}
