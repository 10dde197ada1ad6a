/**
 * @file main.cpp
 * @brief secbox CLI entry point
 *
 * Commands:
 *   analyze   - Parse code and print structural metrics
 *   validate  - Run the security rule engine
 *   quick     - Critical-rule-only security check
 *   execute   - Validate and run code in the sandbox
 *   status    - Initialize engines and print their status
 *   version   - Show version information
 */

#include "secbox/common.hpp"
#include "secbox/config.hpp"
#include "secbox/engine.hpp"
#include "secbox/language.hpp"
#include "secbox/logging.hpp"
#include "secbox/runtime.hpp"
#include "secbox/types.hpp"
#include "secbox/version.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

/// Exit code for a completed command whose verdict is negative
constexpr int kExitRejected = 2;

void print_version()
{
    std::println("secbox {} ({})", secbox::kVersion, secbox::kBuildId);
    std::println("  rules:   {}", secbox::kRuleCatalogVersion);
    std::println("  config:  {}", secbox::kConfigSchemaVersion);
    std::println("  request: {}", secbox::kRequestSchemaVersion);
    std::println("  limits:  {}", secbox::kLimitsSchemaVersion);
}

void print_help()
{
    std::print(R"(secbox - Secure code-execution sandbox for Python, JavaScript and TypeScript

Usage: secbox <command> [options]

Commands:
  analyze     Parse code and print structural metrics
  validate    Run the security rule engine and print findings
  quick       Critical-rule-only security check
  execute     Validate and run code in the sandbox
  status      Initialize engines and print their status
  version     Show version information

Common Options:
  --language LANG       python, javascript or typescript
  --file FILE, -f       Read code from FILE (default: stdin)
  --config FILE         Configuration file (default: config/secbox.json)
  --schema-dir DIR      Path to schema directory (default: ./schemas)
  --help, -h            Show this help message

Run 'secbox <command> --help' for command-specific options.
)");
}

void print_validate_help()
{
    std::print(R"(Usage: secbox validate --language LANG [options]

Run the security rule engine

Options:
  --file FILE, -f           Read code from FILE (default: stdin)
  --category NAME           Only evaluate rules of this category (repeatable)
  --no-educational          Omit educational feedback
  --config FILE             Configuration file
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help

Exit status: 0 valid, 2 rejected, 1 error
)");
}

void print_execute_help()
{
    std::print(R"(Usage: secbox execute (--language LANG [options] | --request FILE)

Validate and run code in the sandbox

Options:
  --file FILE, -f           Read code from FILE (default: stdin)
  --request FILE            JSON execution request (execution_request.v1)
  --input VALUE             Replayed input line (repeatable)
  --no-strict               Attach validation without blocking execution
  --skip-validation         Do not run security validation
  --config FILE             Configuration file
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help

Exit status: 0 success, 2 blocked or failed, 1 error
)");
}

void print_simple_help(std::string_view command, std::string_view summary)
{
    std::print(R"(Usage: secbox {} --language LANG [options]

{}

Options:
  --file FILE, -f           Read code from FILE (default: stdin)
  --config FILE             Configuration file
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)",
               command,
               summary);
}

struct CommandOptions
{
    std::string language;
    std::string file;
    std::string request;
    std::string config;
    std::string schema_dir;
    std::vector<std::string> inputs;
    std::vector<std::string> categories;
    bool educational;
    bool strict;
    bool skip_validation;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> secbox::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            secbox::Error::make("MissingArgument", std::format("Missing value for option: {}", option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_command_option(std::string_view arg,
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      CommandOptions& options,
                                      bool& skip_next) -> secbox::Result<bool>
{
    if (arg == "--no-educational") {
        options.educational = false;
        return true;
    }
    if (arg == "--no-strict") {
        options.strict = false;
        return true;
    }
    if (arg == "--skip-validation") {
        options.skip_validation = true;
        return true;
    }

    std::string* target = nullptr;
    std::vector<std::string>* list = nullptr;
    if (arg == "--language" || arg == "-l") {
        target = &options.language;
    } else if (arg == "--file" || arg == "-f") {
        target = &options.file;
    } else if (arg == "--request") {
        target = &options.request;
    } else if (arg == "--config") {
        target = &options.config;
    } else if (arg == "--schema-dir") {
        target = &options.schema_dir;
    } else if (arg == "--input") {
        list = &options.inputs;
    } else if (arg == "--category") {
        list = &options.categories;
    } else {
        return std::unexpected(secbox::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (target != nullptr) {
        *target = std::move(*value);
    } else {
        list->push_back(std::move(*value));
    }
    skip_next = true;
    return true;
}

[[nodiscard]] secbox::Result<CommandOptions> parse_command_args(std::span<char*> args)
{
    CommandOptions options{.language = std::string{},
                           .file = std::string{},
                           .request = std::string{},
                           .config = "config/secbox.json",
                           .schema_dir = "schemas",
                           .inputs = {},
                           .categories = {},
                           .educational = true,
                           .strict = true,
                           .skip_validation = false,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_command_option(arg, args, static_cast<std::size_t>(i), options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
    }
    return options;
}

[[nodiscard]] secbox::Result<std::string> read_code(const CommandOptions& options)
{
    if (!options.file.empty()) {
        return secbox::common::read_text_file(options.file);
    }
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

/// Configuration plus logging setup
[[nodiscard]] secbox::Result<secbox::common::SandboxConfig> load_configuration(const CommandOptions& options)
{
    auto config = secbox::common::load_config(options.config, options.schema_dir);
    if (!config) {
        return std::unexpected(config.error());
    }
    if (auto logging = secbox::common::init_logging(config->logging); !logging) {
        return std::unexpected(logging.error());
    }
    return config;
}

void print_json(const nlohmann::json& payload)
{
    std::println("{}", payload.dump(2));
}

[[nodiscard]] int fail(const secbox::Error& error)
{
    std::println(stderr, "Error: {}", error.describe());
    return 1;
}

[[nodiscard]] secbox::Result<secbox::Language> require_language(const CommandOptions& options)
{
    if (options.language.empty()) {
        return std::unexpected(secbox::Error::make("MissingArgument", "--language is required"));
    }
    return secbox::parse_language(options.language);
}

struct CommandInput
{
    secbox::Language language;
    secbox::common::SandboxConfig config;
    std::string code;
};

[[nodiscard]] secbox::Result<CommandInput> prepare_input(const CommandOptions& options)
{
    auto language = require_language(options);
    if (!language) {
        return std::unexpected(language.error());
    }
    auto config = load_configuration(options);
    if (!config) {
        return std::unexpected(config.error());
    }
    auto code = read_code(options);
    if (!code) {
        return std::unexpected(code.error());
    }
    return CommandInput{.language = *language, .config = std::move(*config), .code = std::move(*code)};
}

[[nodiscard]] int run_analyze(const CommandOptions& options)
{
    auto input = prepare_input(options);
    if (!input) {
        return fail(input.error());
    }
    secbox::runtime::Runtime runtime(std::move(input->config));
    const auto analysis = runtime.analyze(input->code, input->language);
    print_json(analysis);
    return analysis.success ? 0 : kExitRejected;
}

[[nodiscard]] int run_validate(const CommandOptions& options)
{
    auto input = prepare_input(options);
    if (!input) {
        return fail(input.error());
    }
    secbox::runtime::Runtime runtime(std::move(input->config));
    auto validation_options = runtime.default_validation_options();
    validation_options.educational_mode = options.educational;
    for (const auto& tag : options.categories) {
        auto category = secbox::parse_rule_category(tag);
        if (!category) {
            return fail(category.error());
        }
        validation_options.enabled_categories.push_back(*category);
    }
    const auto result = runtime.validate(input->code, input->language, validation_options);
    print_json(result);
    return result.is_valid ? 0 : kExitRejected;
}

[[nodiscard]] int run_quick(const CommandOptions& options)
{
    auto input = prepare_input(options);
    if (!input) {
        return fail(input.error());
    }
    secbox::runtime::Runtime runtime(std::move(input->config));
    const auto result = runtime.quick_validate(input->code, input->language);
    print_json(result);
    return result.is_valid ? 0 : kExitRejected;
}

[[nodiscard]] int run_execute(const CommandOptions& options)
{
    auto config = load_configuration(options);
    if (!config) {
        return fail(config.error());
    }
    secbox::runtime::Runtime runtime(std::move(*config));

    secbox::Result<secbox::ExecutionResult> result;
    if (!options.request.empty()) {
        auto request = secbox::common::read_json_file(options.request);
        if (!request) {
            return fail(request.error());
        }
        result = runtime.execute_json(*request, options.schema_dir);
    } else {
        auto language = require_language(options);
        if (!language) {
            return fail(language.error());
        }
        auto code = read_code(options);
        if (!code) {
            return fail(code.error());
        }
        secbox::ExecutionRequest request{.language = *language,
                                         .code = std::move(*code),
                                         .inputs = options.inputs,
                                         .limits = runtime.config().default_limits,
                                         .strict_security_mode = options.strict,
                                         .skip_security_validation = options.skip_validation,
                                         .inspect_variables = true,
                                         .hidden_prefixes = {}};
        result = runtime.execute(request);
    }
    if (!result) {
        return fail(result.error());
    }
    print_json(*result);
    return result->success ? 0 : kExitRejected;
}

[[nodiscard]] int run_status(const CommandOptions& options)
{
    auto config = load_configuration(options);
    if (!config) {
        return fail(config.error());
    }
    secbox::runtime::Runtime runtime(std::move(*config));
    for (const auto language : secbox::kAllLanguages) {
        (void)runtime.warm_up(language);
    }
    nlohmann::json engines = nlohmann::json::array();
    for (const auto language : secbox::kAllLanguages) {
        runtime.warm_up(language).wait();
        engines.push_back(runtime.engine_status(language));
    }
    print_json(nlohmann::json{
        {"engines", engines}
    });
    return 0;
}

template <typename Runner>
int dispatch(int argc, char** argv, Runner runner, void (*help)())
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        help();
        return 0;
    }
    return runner(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return dispatch(sub_argc, sub_argv, run_analyze, [] {
                print_simple_help("analyze", "Parse code and print structural metrics");
            });
        }
        if (cmd == "validate") {
            return dispatch(sub_argc, sub_argv, run_validate, print_validate_help);
        }
        if (cmd == "quick") {
            return dispatch(sub_argc, sub_argv, run_quick, [] {
                print_simple_help("quick", "Critical-rule-only security check");
            });
        }
        if (cmd == "execute") {
            return dispatch(sub_argc, sub_argv, run_execute, print_execute_help);
        }
        if (cmd == "status") {
            return dispatch(sub_argc, sub_argv, run_status, [] {
                print_simple_help("status", "Initialize engines and print their status");
            });
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
