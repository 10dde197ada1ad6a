/**
 * @file matcher.cpp
 * @brief Rule evaluation over the syntax tree and the raw source lines
 */

#include "secbox/rules.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <iterator>
#include <string>
#include <tuple>

namespace secbox::rules {

namespace {

using ast::LiteralKind;
using ast::Node;
using ast::NodeKind;

constexpr std::size_t kMaxSnippetLength = 120;

/// Source split into lines without their terminators
class SourceLines
{
public:
    explicit SourceLines(std::string_view code)
    {
        std::size_t start = 0;
        while (start <= code.size()) {
            auto end = code.find('\n', start);
            if (end == std::string_view::npos) {
                end = code.size();
            }
            auto line = code.substr(start, end - start);
            if (line.ends_with('\r')) {
                line.remove_suffix(1);
            }
            m_lines.push_back(line);
            start = end + 1;
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_lines.size(); }

    [[nodiscard]] std::string_view at(std::size_t index) const noexcept { return m_lines[index]; }

    /// Trimmed text of a 1-based line, shortened for display
    [[nodiscard]] std::string snippet(std::uint32_t line) const
    {
        if (line == 0 || line > m_lines.size()) {
            return {};
        }
        auto text = m_lines[line - 1];
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos) {
            return {};
        }
        text = text.substr(first, text.find_last_not_of(" \t") - first + 1);
        if (text.size() > kMaxSnippetLength) {
            return std::format("{}...", text.substr(0, kMaxSnippetLength));
        }
        return std::string(text);
    }

private:
    std::vector<std::string_view> m_lines;
};

[[nodiscard]] Finding make_finding(const SecurityRule& rule,
                                   std::uint32_t line,
                                   std::uint32_t column,
                                   std::string snippet)
{
    return Finding{.rule_id = std::string(rule.id),
                   .rule_name = std::string(rule.name),
                   .category = rule.category,
                   .severity = rule.severity,
                   .line = line,
                   .column = column,
                   .snippet = std::move(snippet),
                   .message = std::format("{}: {}", rule.name, rule.description)};
}

[[nodiscard]] bool is_identifier(const Node& node, std::string_view name)
{
    return node.kind == NodeKind::kIdentifier && node.name == name;
}

/// `name` is either a plain identifier or `object.property`
[[nodiscard]] bool callee_matches(const Node& callee, std::string_view name)
{
    const auto dot = name.find('.');
    if (dot == std::string_view::npos) {
        return is_identifier(callee, name);
    }
    return callee.kind == NodeKind::kMember && callee.name == name.substr(dot + 1)
           && !callee.children.empty() && is_identifier(*callee.children.front(), name.substr(0, dot));
}

[[nodiscard]] bool callee_in(const Node& call, const std::vector<std::string_view>& names)
{
    if (call.children.empty()) {
        return false;
    }
    const Node& callee = *call.children.front();
    return std::ranges::any_of(names, [&](std::string_view name) { return callee_matches(callee, name); });
}

[[nodiscard]] std::optional<double> numeric_value(const Node& node)
{
    if (node.kind != NodeKind::kLiteral || node.literal != LiteralKind::kNumber) {
        return std::nullopt;
    }
    std::string digits;
    std::ranges::copy_if(node.text, std::back_inserter(digits), [](char c) { return c != '_'; });
    double value = 0.0;
    const auto* const last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] bool has_large_argument(const Node& call, std::int64_t minimum)
{
    for (std::size_t i = 1; i < call.children.size(); ++i) {
        const auto value = numeric_value(*call.children[i]);
        if (value && *value >= static_cast<double>(minimum)) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] bool module_matches(std::string_view module, const std::vector<std::string_view>& names)
{
    if (module.starts_with("node:")) {
        module.remove_prefix(5);
    }
    return std::ranges::any_of(names, [&](std::string_view name) {
        if (module == name) {
            return true;
        }
        return module.size() > name.size() && module.starts_with(name)
               && (module[name.size()] == '.' || module[name.size()] == '/');
    });
}

/// Module named by an import statement, require("m") or import("m")
[[nodiscard]] bool imports_module(const Node& node, const std::vector<std::string_view>& names)
{
    if (node.kind == NodeKind::kImport) {
        return std::ranges::any_of(node.children, [&](const auto& module) {
            return module->kind == NodeKind::kLiteral && module_matches(module->text, names);
        });
    }
    if (node.kind != NodeKind::kCall || node.children.size() < 2) {
        return false;
    }
    const Node& callee = *node.children.front();
    if (!is_identifier(callee, "require") && !is_identifier(callee, "import")) {
        return false;
    }
    const Node& argument = *node.children[1];
    return argument.kind == NodeKind::kLiteral && argument.literal == LiteralKind::kString
           && module_matches(argument.text, names);
}

/**
 * Location of the node a matcher fires on, or nullopt.
 * Member access reports the object, so `process.env.X` points at `process`.
 */
[[nodiscard]] std::optional<ast::SourceLocation> match(const Matcher& matcher, const Node& node)
{
    switch (matcher.kind) {
        case MatchKind::kCall:
            if (node.kind == NodeKind::kCall && callee_in(node, matcher.names)
                && (!matcher.min_numeric_argument
                    || has_large_argument(node, *matcher.min_numeric_argument))) {
                return node.location;
            }
            return std::nullopt;
        case MatchKind::kConstruct:
            if ((node.kind == NodeKind::kNew || node.kind == NodeKind::kCall) && callee_in(node, matcher.names)
                && (!matcher.min_numeric_argument
                    || has_large_argument(node, *matcher.min_numeric_argument))) {
                return node.location;
            }
            return std::nullopt;
        case MatchKind::kModule:
            if (imports_module(node, matcher.names)) {
                return node.location;
            }
            return std::nullopt;
        case MatchKind::kMemberOf:
            if (node.kind == NodeKind::kMember && !node.children.empty()) {
                const Node& object = *node.children.front();
                if (object.kind == NodeKind::kIdentifier
                    && std::ranges::find(matcher.names, object.name) != matcher.names.end()) {
                    return object.location;
                }
            }
            return std::nullopt;
        case MatchKind::kAttribute:
            if (node.kind == NodeKind::kMember && !node.name.empty()
                && ((!matcher.attribute_prefix.empty() && node.children.size() == 1
                     && node.name.starts_with(matcher.attribute_prefix))
                    || std::ranges::find(matcher.names, node.name) != matcher.names.end())) {
                return node.location;
            }
            return std::nullopt;
        case MatchKind::kInfiniteLoop:
            if (std::ranges::find(matcher.loop_kinds, node.kind) != matcher.loop_kinds.end()
                && ast::is_infinite_loop(node)) {
                return node.location;
            }
            return std::nullopt;
        case MatchKind::kText:
            return std::nullopt;
    }
    return std::nullopt;
}

class RuleVisitor final : public ast::AstVisitor
{
public:
    RuleVisitor(std::span<const SecurityRule* const> rules, const SourceLines& lines, std::vector<Finding>& out)
        : m_rules(rules)
        , m_lines(lines)
        , m_out(out)
    {}

    void enter(const Node& node) override
    {
        for (const SecurityRule* rule : m_rules) {
            for (const auto& matcher : rule->matchers) {
                const auto location = match(matcher, node);
                if (location) {
                    m_out.push_back(
                        make_finding(*rule, location->line, location->column, m_lines.snippet(location->line)));
                    break;
                }
            }
        }
    }

private:
    std::span<const SecurityRule* const> m_rules;
    const SourceLines& m_lines;
    std::vector<Finding>& m_out;
};

void scan_text(const SecurityRule& rule, const SourceLines& lines, std::vector<Finding>& out)
{
    for (const auto& matcher : rule.matchers) {
        if (matcher.kind != MatchKind::kText || !matcher.pattern) {
            continue;
        }
        for (std::size_t index = 0; index < lines.size(); ++index) {
            const auto line = lines.at(index);
            using Iterator = std::regex_iterator<std::string_view::const_iterator>;
            for (Iterator it(line.begin(), line.end(), *matcher.pattern), end; it != end; ++it) {
                out.push_back(make_finding(rule,
                                           static_cast<std::uint32_t>(index + 1),
                                           static_cast<std::uint32_t>(it->position()),
                                           it->str()));
            }
        }
    }
}

}  // namespace

std::vector<Finding> evaluate(std::span<const SecurityRule* const> rules, const ast::Node& root, std::string_view code)
{
    const SourceLines lines(code);
    std::vector<const SecurityRule*> tree_rules;
    std::vector<Finding> findings;
    for (const SecurityRule* rule : rules) {
        if (rule->is_text_rule()) {
            scan_text(*rule, lines, findings);
        } else {
            tree_rules.push_back(rule);
        }
    }
    RuleVisitor visitor(tree_rules, lines, findings);
    ast::walk(root, visitor);

    std::ranges::sort(findings, [](const Finding& a, const Finding& b) {
        return std::tie(a.line, a.column, a.rule_id) < std::tie(b.line, b.column, b.rule_id);
    });
    return findings;
}

Finding parse_failure_finding(const AnalysisResult& analysis)
{
    std::string message = "Failed to parse code";
    if (!analysis.errors.empty()) {
        message = std::format("{}: {}", message, analysis.errors.front());
    }
    return Finding{.rule_id = std::string(kParseFailureRuleId),
                   .rule_name = "Parse Error",
                   .category = RuleCategory::kCodeInjection,
                   .severity = Severity::kCritical,
                   .line = 0,
                   .column = 0,
                   .snippet = {},
                   .message = std::move(message)};
}

}  // namespace secbox::rules
