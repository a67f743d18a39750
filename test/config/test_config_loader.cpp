#include <catch2/catch_test_macros.hpp>

#include <toolmux/config/config_loader.hpp>
#include <toolmux/core/version.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace toolmux;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

AppConfig ConfigWith(std::vector<EndpointConfig> endpoints) {
    AppConfig config;
    config.client = DefaultClientIdentity();
    config.endpoints = std::move(endpoints);
    return config;
}

EndpointConfig Sse(const std::string& name, const std::string& url) {
    return EndpointConfig{name, SseTransport{url}};
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.endpoints.size() == 2);

    CHECK(config.endpoints[0].name == "default");
    const auto* sse = std::get_if<SseTransport>(&config.endpoints[0].transport);
    REQUIRE(sse != nullptr);
    CHECK(sse->url == "http://127.0.0.1:8811/sse");

    CHECK(config.endpoints[1].name == "kube");
    const auto* stdio = std::get_if<StdioTransport>(&config.endpoints[1].transport);
    REQUIRE(stdio != nullptr);
    CHECK(stdio->command == "kube-mcp");
    CHECK(stdio->args == std::vector<std::string>{"--namespace", "prod"});
    REQUIRE(stdio->env.count("KUBECONFIG") == 1);
    CHECK(stdio->env.at("KUBECONFIG") == "/etc/kube/config");

    CHECK(config.client.name == "fleet-runner");
    CHECK(config.client.version == "2.1.0");
    CHECK(config.timeout_seconds == 30);
    CHECK(config.notification_queue_capacity == 64);
    CHECK(config.report_indent == "  ");
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/toolmux.log");
}

TEST_CASE("LoadFromYaml: minimal config uses defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.endpoints.size() == 1);
    CHECK(config.endpoints[0].name == "default");
    CHECK(config.client.name == "toolmux");
    CHECK(config.client.version == kVersion);
    CHECK_FALSE(config.timeout_seconds.has_value());
    CHECK(config.notification_queue_capacity == 256);
    CHECK(config.report_indent == "    ");
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: servers keep document order", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("ordered_servers.yaml"));
    REQUIRE(result.IsOk());
    const auto& endpoints = result.Value().endpoints;
    REQUIRE(endpoints.size() == 3);
    CHECK(endpoints[0].name == "zeta");
    CHECK(endpoints[1].name == "alpha");
    CHECK(endpoints[2].name == "mid");
}

TEST_CASE("LoadFromYaml: url and command together is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("both_url_and_command.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("broken") != std::string::npos);
}

TEST_CASE("LoadFromYaml: server without url or command is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("neither_url_nor_command.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: args must be a list", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_args.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'args' must be a list") != std::string::npos);
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_syntax.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: mistyped value", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_timeout.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: baseurl registers the default alias", "[config][cli]") {
    const char* argv[] = {
        "toolmux",
        "--baseurl", "http://127.0.0.1:8811/sse",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    REQUIRE(config.endpoints.size() == 1);
    CHECK(config.endpoints[0].name == "default");
    CHECK(std::get<SseTransport>(config.endpoints[0].transport).url ==
          "http://127.0.0.1:8811/sse");
    CHECK(config.client.name == "toolmux");
}

TEST_CASE("LoadFromCli: repeated --server flags", "[config][cli]") {
    const char* argv[] = {
        "toolmux",
        "--baseurl", "http://127.0.0.1:1/sse",
        "--server", "kube=http://127.0.0.1:2/sse",
        "--server", "git=http://127.0.0.1:3/sse",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& endpoints = result.Value().endpoints;
    REQUIRE(endpoints.size() == 3);
    CHECK(endpoints[0].name == "default");
    CHECK(endpoints[1].name == "kube");
    CHECK(endpoints[2].name == "git");
    CHECK(std::get<SseTransport>(endpoints[2].transport).url == "http://127.0.0.1:3/sse");
}

TEST_CASE("LoadFromCli: tool invocation flags", "[config][cli]") {
    const char* argv[] = {
        "toolmux",
        "--tool", "default.pull_image",
        "--args", "{\"image\":\"redis:latest\"}",
        "--timeout", "15",
        "--json",
        "-v",
        "--log-file", "/tmp/run.log",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    REQUIRE(config.tool.has_value());
    CHECK(*config.tool == "default.pull_image");
    CHECK(config.args_json == "{\"image\":\"redis:latest\"}");
    CHECK(config.timeout_seconds == 15);
    CHECK(config.json_output);
    CHECK(config.verbose);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/run.log");
}

TEST_CASE("LoadFromCli: malformed --server spec", "[config][cli]") {
    const char* argv[] = {"toolmux", "--server", "no-equals-sign"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"toolmux", "--frobnicate"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// ParseServerSpec
// ===========================================================================

TEST_CASE("ParseServerSpec: splits at the first '='", "[config][cli]") {
    auto result = ParseServerSpec("kube=http://h/sse?a=b");
    REQUIRE(result.IsOk());
    CHECK(result.Value().name == "kube");
    CHECK(std::get<SseTransport>(result.Value().transport).url == "http://h/sse?a=b");
}

TEST_CASE("ParseServerSpec: rejects empty parts", "[config][cli]") {
    CHECK(ParseServerSpec("=http://h/sse").IsErr());
    CHECK(ParseServerSpec("kube=").IsErr());
    CHECK(ParseServerSpec("kube").IsErr());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI endpoints replace same alias, others append", "[config][merge]") {
    auto yaml = ConfigWith({Sse("default", "http://yaml/sse"), Sse("kube", "http://kube/sse")});
    auto cli = ConfigWith({Sse("default", "http://cli/sse"), Sse("git", "http://git/sse")});

    auto merged = MergeConfigs(yaml, cli);
    REQUIRE(merged.endpoints.size() == 3);
    CHECK(merged.endpoints[0].name == "default");
    CHECK(std::get<SseTransport>(merged.endpoints[0].transport).url == "http://cli/sse");
    CHECK(merged.endpoints[1].name == "kube");
    CHECK(merged.endpoints[2].name == "git");
}

TEST_CASE("MergeConfigs: CLI options override only when set", "[config][merge]") {
    auto yaml = ConfigWith({Sse("default", "http://yaml/sse")});
    yaml.timeout_seconds = 30;
    yaml.client = ClientIdentity{"fleet-runner", "2.1.0"};
    yaml.report_indent = "  ";

    AppConfig cli;
    cli.tool = "default.ping";
    cli.json_output = true;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.timeout_seconds == 30);
    CHECK(merged.client.name == "fleet-runner");
    CHECK(merged.report_indent == "  ");
    REQUIRE(merged.tool.has_value());
    CHECK(*merged.tool == "default.ping");
    CHECK(merged.json_output);
    CHECK_FALSE(merged.args_json.has_value());

    cli.timeout_seconds = 5;
    cli.args_json = "{\"a\":1}";
    merged = MergeConfigs(yaml, cli);
    CHECK(merged.timeout_seconds == 5);
    CHECK(merged.args_json == "{\"a\":1}");
}

TEST_CASE("MergeConfigs: CLI flags equal to the defaults still override", "[config][merge]") {
    auto yaml = ConfigWith({Sse("default", "http://yaml/sse")});
    yaml.timeout_seconds = 30;
    yaml.args_json = "{\"image\":\"redis:latest\"}";

    const char* argv[] = {
        "toolmux",
        "--tool", "default.ping",
        "--timeout", "90",
        "--args", "{}",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto cli = LoadFromCli(argc, argv);
    REQUIRE(cli.IsOk());
    REQUIRE(cli.Value().timeout_seconds.has_value());
    REQUIRE(cli.Value().args_json.has_value());

    auto merged = MergeConfigs(yaml, cli.Value());
    REQUIRE(merged.timeout_seconds.has_value());
    CHECK(*merged.timeout_seconds == 90);
    REQUIRE(merged.args_json.has_value());
    CHECK(*merged.args_json == "{}");
}

TEST_CASE("LoadFromCli: absent flags stay unset", "[config][cli]") {
    const char* argv[] = {"toolmux", "--server", "default=http://h/sse"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().timeout_seconds.has_value());
    CHECK_FALSE(result.Value().args_json.has_value());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config", "[config][validate]") {
    CHECK(ValidateConfig(ConfigWith({Sse("default", "http://h/sse")})).IsOk());
}

TEST_CASE("ValidateConfig: no endpoints", "[config][validate]") {
    auto result = ValidateConfig(ConfigWith({}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ValidateConfig: alias rules", "[config][validate]") {
    CHECK(ValidateConfig(ConfigWith({Sse("", "http://h/sse")})).IsErr());
    CHECK(ValidateConfig(ConfigWith({Sse("a.b", "http://h/sse")})).IsErr());
    CHECK(ValidateConfig(ConfigWith({Sse("x", "http://h/sse"), Sse("x", "http://i/sse")}))
              .IsErr());
}

TEST_CASE("ValidateConfig: numeric limits", "[config][validate]") {
    auto config = ConfigWith({Sse("default", "http://h/sse")});
    config.timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());

    config.timeout_seconds.reset();
    CHECK(ValidateConfig(config).IsOk());

    config.timeout_seconds = 10;
    config.notification_queue_capacity = 0;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: verbose and quiet are exclusive", "[config][validate]") {
    auto config = ConfigWith({Sse("default", "http://h/sse")});
    config.verbose = true;
    config.quiet = true;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--verbose") != std::string::npos);
}

TEST_CASE("ValidateConfig: malformed URLs are left to session construction", "[config][validate]") {
    CHECK(ValidateConfig(ConfigWith({Sse("default", "not a url")})).IsOk());
}
