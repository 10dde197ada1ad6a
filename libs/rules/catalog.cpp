/**
 * @file catalog.cpp
 * @brief Static security rule catalog (rules.v1)
 */

#include "secbox/rules.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <utility>

namespace secbox::rules {

namespace {

using ast::NodeKind;

const std::vector<Language> kJavaScriptFamily = {Language::kJavaScript, Language::kTypeScript};
const std::vector<Language> kPythonOnly = {Language::kPython};

[[nodiscard]] Matcher tree(MatchKind kind, std::initializer_list<std::string_view> names)
{
    return Matcher{.kind = kind,
                   .names = names,
                   .loop_kinds = {},
                   .min_numeric_argument = {},
                   .pattern = {},
                   .attribute_prefix = {}};
}

[[nodiscard]] Matcher attributes(std::string_view prefix, std::initializer_list<std::string_view> names)
{
    Matcher matcher = tree(MatchKind::kAttribute, names);
    matcher.attribute_prefix = prefix;
    return matcher;
}

[[nodiscard]] Matcher numeric(MatchKind kind, std::string_view name, std::int64_t minimum)
{
    Matcher matcher = tree(kind, {name});
    matcher.min_numeric_argument = minimum;
    return matcher;
}

[[nodiscard]] Matcher infinite_loop(std::initializer_list<NodeKind> kinds)
{
    return Matcher{.kind = MatchKind::kInfiniteLoop,
                   .names = {},
                   .loop_kinds = kinds,
                   .min_numeric_argument = {},
                   .pattern = {},
                   .attribute_prefix = {}};
}

[[nodiscard]] Matcher text(const char* pattern)
{
    return Matcher{.kind = MatchKind::kText,
                   .names = {},
                   .loop_kinds = {},
                   .min_numeric_argument = {},
                   .pattern = std::make_shared<const std::regex>(
                       pattern, std::regex::ECMAScript | std::regex::optimize),
                   .attribute_prefix = {}};
}

constexpr std::int64_t kLargeAllocation = 100'000;

std::vector<SecurityRule> javascript_rules()
{
    std::vector<SecurityRule> rules;
    rules.push_back(SecurityRule{
        .id = "js-eval-usage",
        .name = "eval() Usage",
        .description = "Code uses eval() which can execute arbitrary code",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kCall, {"eval", "window.eval", "globalThis.eval"})},
        .educational_message = "eval() can execute arbitrary JavaScript code, making it dangerous for user "
                               "input. Use JSON.parse() for JSON data or safer alternatives.",
        .example_safe = "const data = JSON.parse(jsonString);",
        .example_unsafe = "const data = eval(userInput);"});
    rules.push_back(SecurityRule{
        .id = "js-function-constructor",
        .name = "Function Constructor",
        .description = "Code uses Function constructor which can execute arbitrary code",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kConstruct, {"Function"})},
        .educational_message =
            "Function constructor can create functions from strings, potentially executing malicious code.",
        .example_safe = "const add = (a, b) => a + b;",
        .example_unsafe = "const add = new Function(\"a\", \"b\", \"return a + b\");"});
    rules.push_back(SecurityRule{
        .id = "js-prototype-escape",
        .name = "Prototype Chain Escape",
        .description = "Code reaches constructors or host internals through object properties",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {attributes({},
                                {"constructor", "__proto__", "mainModule", "caller", "callee", "__defineGetter__",
                                 "__defineSetter__", "__lookupGetter__", "__lookupSetter__"})},
        .educational_message = "A function's constructor property is the Function constructor, which compiles "
                               "strings into code from outside the sandbox. Call your own functions directly.",
        .example_safe = "const make = (x) => ({ value: x });",
        .example_unsafe = "const F = fn.constructor; F(\"return process\")();"});
    rules.push_back(SecurityRule{
        .id = "js-fs-access",
        .name = "File System Access",
        .description = "Code attempts to access the file system",
        .category = RuleCategory::kFileSystem,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kModule, {"fs"})},
        .educational_message = "File system access is not allowed in the secure sandbox. Use provided APIs for "
                               "data persistence.",
        .example_safe = "// Use localStorage or provided storage APIs",
        .example_unsafe = "const fs = require(\"fs\");"});
    rules.push_back(SecurityRule{
        .id = "js-path-traversal",
        .name = "Path Traversal",
        .description = "Code uses dangerous path patterns",
        .category = RuleCategory::kFileSystem,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {text(R"(\.\.[/\\])")},
        .educational_message =
            "Path traversal patterns (../) can access files outside the intended directory.",
        .example_safe = "const file = \"data.txt\";",
        .example_unsafe = "const file = \"../../../etc/passwd\";"});
    rules.push_back(SecurityRule{
        .id = "js-fetch-usage",
        .name = "Network Requests",
        .description = "Code makes network requests",
        .category = RuleCategory::kNetwork,
        .severity = Severity::kWarning,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kCall, {"fetch", "axios", "request"}),
                     tree(MatchKind::kConstruct, {"XMLHttpRequest"}),
                     tree(MatchKind::kMemberOf, {"axios"})},
        .educational_message =
            "Network requests are restricted in the sandbox. Use provided APIs for external data.",
        .example_safe = "// Use provided data APIs",
        .example_unsafe = "fetch(\"https://external-api.com/data\");"});
    rules.push_back(SecurityRule{
        .id = "js-websocket-usage",
        .name = "WebSocket Usage",
        .description = "Code creates WebSocket connections",
        .category = RuleCategory::kNetwork,
        .severity = Severity::kWarning,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kConstruct, {"WebSocket"})},
        .educational_message = "WebSocket connections are not allowed in the sandbox environment.",
        .example_safe = "// Use provided communication APIs",
        .example_unsafe = "const ws = new WebSocket(\"ws://localhost:8080\");"});
    rules.push_back(SecurityRule{
        .id = "js-network-module",
        .name = "Network Module Import",
        .description = "Code imports a raw networking module",
        .category = RuleCategory::kNetwork,
        .severity = Severity::kWarning,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kModule, {"http", "https", "http2", "net", "dgram", "tls", "dns"})},
        .educational_message = "Network modules are blocked inside the sandbox; connections will fail at runtime.",
        .example_safe = "// Use provided data APIs",
        .example_unsafe = "const http = require(\"http\");"});
    rules.push_back(SecurityRule{
        .id = "js-process-access",
        .name = "Process Access",
        .description = "Code accesses process object",
        .category = RuleCategory::kProcess,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kMemberOf, {"process"})},
        .educational_message = "Process object access is restricted in the sandbox for security.",
        .example_safe = "// Use environment variables through provided APIs",
        .example_unsafe = "process.exit(1);"});
    rules.push_back(SecurityRule{
        .id = "js-child-process",
        .name = "Child Process",
        .description = "Code attempts to spawn child processes",
        .category = RuleCategory::kProcess,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {tree(MatchKind::kModule, {"child_process", "worker_threads", "cluster"})},
        .educational_message = "Child process spawning is not allowed for security reasons.",
        .example_safe = "// Use provided computation APIs",
        .example_unsafe = "const { spawn } = require(\"child_process\");"});
    rules.push_back(SecurityRule{
        .id = "js-large-array",
        .name = "Large Array Creation",
        .description = "Code creates potentially large arrays",
        .category = RuleCategory::kMemory,
        .severity = Severity::kWarning,
        .languages = kJavaScriptFamily,
        .matchers = {numeric(MatchKind::kConstruct, "Array", kLargeAllocation)},
        .educational_message = "Creating very large arrays can consume excessive memory. Consider using "
                               "generators or streaming.",
        .example_safe = "function* generateNumbers(max) { for(let i = 0; i < max; i++) yield i; }",
        .example_unsafe = "const arr = new Array(1000000).fill(0);"});
    rules.push_back(SecurityRule{
        .id = "js-while-true",
        .name = "Infinite While Loop",
        .description = "Code contains potential infinite while loop",
        .category = RuleCategory::kInfiniteLoop,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {infinite_loop({NodeKind::kWhile, NodeKind::kDoWhile})},
        .educational_message = "Infinite loops can freeze the execution environment. Ensure loops have proper "
                               "exit conditions.",
        .example_safe = "while (condition && counter < maxIterations)",
        .example_unsafe = "while (true) { /* no break condition */ }"});
    rules.push_back(SecurityRule{
        .id = "js-for-infinite",
        .name = "Infinite For Loop",
        .description = "Code contains potential infinite for loop",
        .category = RuleCategory::kInfiniteLoop,
        .severity = Severity::kCritical,
        .languages = kJavaScriptFamily,
        .matchers = {infinite_loop({NodeKind::kFor})},
        .educational_message = "For loops without conditions can run indefinitely. Always include proper "
                               "termination conditions.",
        .example_safe = "for (let i = 0; i < 100; i++)",
        .example_unsafe = "for (;;) { /* infinite loop */ }"});
    return rules;
}

std::vector<SecurityRule> python_rules()
{
    std::vector<SecurityRule> rules;
    rules.push_back(SecurityRule{
        .id = "py-eval-usage",
        .name = "eval() Usage",
        .description = "Code uses eval() which can execute arbitrary Python code",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kCall, {"eval", "builtins.eval"})},
        .educational_message = "eval() can execute arbitrary Python code. Use ast.literal_eval() for safe "
                               "evaluation of literals.",
        .example_safe = "import ast; data = ast.literal_eval(string)",
        .example_unsafe = "data = eval(user_input)"});
    rules.push_back(SecurityRule{
        .id = "py-exec-usage",
        .name = "exec() Usage",
        .description = "Code uses exec() which can execute arbitrary Python code",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kCall, {"exec", "builtins.exec"})},
        .educational_message =
            "exec() can execute arbitrary Python code from strings, which is dangerous with untrusted input.",
        .example_safe = "# Use direct function calls instead",
        .example_unsafe = "exec(user_code)"});
    rules.push_back(SecurityRule{
        .id = "py-compile-usage",
        .name = "compile() Usage",
        .description = "Code uses compile() to create code objects",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kCall, {"compile"})},
        .educational_message = "compile() creates executable code objects which can be dangerous.",
        .example_safe = "# Use predefined functions",
        .example_unsafe = "code = compile(source, \"string\", \"exec\")"});
    rules.push_back(SecurityRule{
        .id = "py-dunder-import",
        .name = "__import__() Usage",
        .description = "Code imports modules dynamically by name",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kCall, {"__import__", "importlib.import_module"}),
                     tree(MatchKind::kModule, {"importlib"})},
        .educational_message =
            "Dynamic imports bypass the import checks and can load any module. Import what you need statically.",
        .example_safe = "import math",
        .example_unsafe = "os = __import__(\"os\")"});
    rules.push_back(SecurityRule{
        .id = "py-introspection-escape",
        .name = "Introspection Escape",
        .description = "Code reaches private attributes, dunder members or interpreter frames",
        .category = RuleCategory::kCodeInjection,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {attributes("_",
                                {"tb_frame", "tb_next", "f_back", "f_globals", "f_locals", "f_builtins", "f_code",
                                 "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code"})},
        .educational_message = "Attributes such as __class__, __subclasses__ or a traceback's tb_frame lead back "
                               "to interpreter internals and the modules the sandbox hides. Use the public "
                               "interface of the objects you work with.",
        .example_safe = "import random\nvalue = random.randint(1, 6)",
        .example_unsafe = "().__class__.__base__.__subclasses__()"});
    rules.push_back(SecurityRule{
        .id = "py-file-operations",
        .name = "File Operations",
        .description = "Code performs file system operations",
        .category = RuleCategory::kFileSystem,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kCall, {"open", "file", "io.open"})},
        .educational_message = "File operations are restricted in the sandbox. Use provided storage APIs.",
        .example_safe = "# Use provided data storage APIs",
        .example_unsafe = "with open(\"file.txt\", \"r\") as f:"});
    rules.push_back(SecurityRule{
        .id = "py-os-import",
        .name = "OS Module Import",
        .description = "Code imports os module",
        .category = RuleCategory::kFileSystem,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kModule, {"os", "shutil", "pathlib"})},
        .educational_message =
            "OS module access is restricted for security. Use provided APIs for system information.",
        .example_safe = "# Use provided environment APIs",
        .example_unsafe = "import os"});
    rules.push_back(SecurityRule{
        .id = "py-urllib-usage",
        .name = "URL Operations",
        .description = "Code makes network requests",
        .category = RuleCategory::kNetwork,
        .severity = Severity::kWarning,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kModule, {"urllib", "urllib3", "requests", "httplib", "http", "ftplib"})},
        .educational_message = "Network requests are restricted in the sandbox environment.",
        .example_safe = "# Use provided data APIs",
        .example_unsafe = "import urllib.request"});
    rules.push_back(SecurityRule{
        .id = "py-socket-usage",
        .name = "Socket Usage",
        .description = "Code uses socket operations",
        .category = RuleCategory::kNetwork,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kModule, {"socket", "ssl"})},
        .educational_message = "Socket operations are not allowed in the secure sandbox.",
        .example_safe = "# Use provided communication APIs",
        .example_unsafe = "import socket"});
    rules.push_back(SecurityRule{
        .id = "py-subprocess-usage",
        .name = "Subprocess Usage",
        .description = "Code uses subprocess module",
        .category = RuleCategory::kProcess,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {tree(MatchKind::kModule, {"subprocess", "multiprocessing", "pty"})},
        .educational_message = "Subprocess execution is not allowed for security reasons.",
        .example_safe = "# Use provided computation functions",
        .example_unsafe = "import subprocess"});
    rules.push_back(SecurityRule{
        .id = "py-subprocess-call",
        .name = "Subprocess Call",
        .description = "Code spawns a process through subprocess",
        .category = RuleCategory::kProcess,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {text(R"(\bsubprocess\s*\.\s*(call|run|Popen|check_call|check_output|getoutput)\s*\()")},
        .educational_message = "Spawning processes is not allowed for security reasons.",
        .example_safe = "# Use provided computation functions",
        .example_unsafe = "subprocess.call([\"ls\", \"-la\"])"});
    rules.push_back(SecurityRule{
        .id = "py-system-calls",
        .name = "System Calls",
        .description = "Code makes system calls",
        .category = RuleCategory::kProcess,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {text(R"(\bos\s*\.\s*(system|popen|exec[lv]p?e?|spawn[lv]p?e?|fork)\s*\()")},
        .educational_message = "System calls can execute arbitrary commands and are not allowed.",
        .example_safe = "# Use provided APIs",
        .example_unsafe = "os.system(\"rm -rf /\")"});
    rules.push_back(SecurityRule{
        .id = "py-large-range",
        .name = "Large Range",
        .description = "Code creates very large ranges",
        .category = RuleCategory::kMemory,
        .severity = Severity::kWarning,
        .languages = kPythonOnly,
        .matchers = {numeric(MatchKind::kCall, "range", kLargeAllocation)},
        .educational_message = "Large ranges can consume excessive memory. Consider using generators.",
        .example_safe = "for i in range(0, max_val, step):",
        .example_unsafe = "list(range(1000000))"});
    rules.push_back(SecurityRule{
        .id = "py-while-true",
        .name = "Infinite While Loop",
        .description = "Code contains potential infinite while loop",
        .category = RuleCategory::kInfiniteLoop,
        .severity = Severity::kCritical,
        .languages = kPythonOnly,
        .matchers = {infinite_loop({NodeKind::kWhile})},
        .educational_message = "Infinite loops can freeze execution. Ensure proper break conditions.",
        .example_safe = "while condition and counter < max_iterations:",
        .example_unsafe = "while True:  # No break condition"});
    return rules;
}

std::vector<SecurityRule> build_catalog()
{
    auto rules = javascript_rules();
    auto python = python_rules();
    rules.insert(rules.end(), std::make_move_iterator(python.begin()), std::make_move_iterator(python.end()));
    return rules;
}

}  // namespace

bool SecurityRule::applies_to(Language language) const
{
    return std::ranges::find(languages, language) != languages.end();
}

bool SecurityRule::is_text_rule() const
{
    return std::ranges::any_of(matchers, [](const Matcher& m) { return m.kind == MatchKind::kText; });
}

const std::vector<SecurityRule>& rule_catalog()
{
    static const std::vector<SecurityRule> kCatalog = build_catalog();
    return kCatalog;
}

const SecurityRule* find_rule(std::string_view id)
{
    const auto& catalog = rule_catalog();
    const auto it = std::ranges::find(catalog, id, &SecurityRule::id);
    return it == catalog.end() ? nullptr : &*it;
}

std::vector<const SecurityRule*> rules_for(Language language,
                                           std::span<const RuleCategory> enabled,
                                           bool critical_only)
{
    std::vector<const SecurityRule*> selected;
    for (const auto& rule : rule_catalog()) {
        if (!rule.applies_to(language)) {
            continue;
        }
        if (!enabled.empty() && std::ranges::find(enabled, rule.category) == enabled.end()) {
            continue;
        }
        if (critical_only && rule.severity != Severity::kCritical) {
            continue;
        }
        selected.push_back(&rule);
    }
    return selected;
}

std::string_view category_title(RuleCategory category) noexcept
{
    switch (category) {
        case RuleCategory::kDangerousFunctions:
            return "Dangerous Functions";
        case RuleCategory::kFileSystem:
            return "File System Access";
        case RuleCategory::kNetwork:
            return "Network Operations";
        case RuleCategory::kProcess:
            return "Process Operations";
        case RuleCategory::kInfiniteLoop:
            return "Infinite Loops";
        case RuleCategory::kMemory:
            return "Memory Issues";
        case RuleCategory::kCodeInjection:
            return "Code Injection";
    }
    return "Unknown";
}

std::string_view category_description(RuleCategory category) noexcept
{
    switch (category) {
        case RuleCategory::kDangerousFunctions:
            return "Functions that can execute arbitrary code or cause security issues";
        case RuleCategory::kFileSystem:
            return "Operations that access the file system or local storage";
        case RuleCategory::kNetwork:
            return "Code that makes network requests or connections";
        case RuleCategory::kProcess:
            return "Operations that interact with system processes";
        case RuleCategory::kInfiniteLoop:
            return "Code patterns that may result in infinite execution";
        case RuleCategory::kMemory:
            return "Operations that may consume excessive memory";
        case RuleCategory::kCodeInjection:
            return "Patterns that allow execution of dynamic code";
    }
    return "";
}

}  // namespace secbox::rules
