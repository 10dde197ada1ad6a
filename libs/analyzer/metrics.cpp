/**
 * @file metrics.cpp
 * @brief Metric extraction and safety warnings over the syntax tree
 */

#include "secbox/analyzer.hpp"

#include "secbox/common.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace secbox::analyzer {

namespace {

using ast::Node;
using ast::NodeKind;

[[nodiscard]] LoopKind loop_kind(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::kWhile:
            return LoopKind::kWhile;
        case NodeKind::kDoWhile:
            return LoopKind::kDoWhile;
        default:
            return LoopKind::kFor;
    }
}

class MetricsCollector final : public ast::AstVisitor
{
public:
    explicit MetricsCollector(CodeMetrics& metrics)
        : m_metrics(metrics)
    {}

    void enter(const Node& node) override
    {
        if (ast::is_function(node.kind)) {
            ++m_metrics.functions;
            ++m_metrics.complexity;
            return;
        }
        if (ast::is_loop(node.kind)) {
            const bool has_break = ast::contains_break(node);
            m_metrics.loops.push_back(LoopInfo{.kind = loop_kind(node.kind),
                                               .line = node.location.line,
                                               .column = node.location.column,
                                               .has_break = has_break,
                                               .is_infinite = ast::is_infinite_loop(node)});
            ++m_metrics.complexity;
            return;
        }
        switch (node.kind) {
            case NodeKind::kClassDecl:
            case NodeKind::kClassExpr:
                ++m_metrics.classes;
                ++m_metrics.complexity;
                break;
            case NodeKind::kImport:
                ++m_metrics.imports;
                break;
            case NodeKind::kCall:
                m_metrics.calls.push_back(CallInfo{.name = node.name,
                                                   .line = node.location.line,
                                                   .column = node.location.column,
                                                   .arg_count = node.argument_count});
                break;
            default:
                break;
        }
    }

private:
    CodeMetrics& m_metrics;
};

[[nodiscard]] bool callee_is_identifier(const Node& call, std::string_view name)
{
    return !call.children.empty() && call.children.front()->kind == NodeKind::kIdentifier
           && call.children.front()->name == name;
}

[[nodiscard]] bool callee_is_member_of(const Node& call, std::string_view object, std::string_view property)
{
    if (call.children.empty()) {
        return false;
    }
    const Node& callee = *call.children.front();
    return callee.kind == NodeKind::kMember && callee.name == property && !callee.children.empty()
           && callee.children.front()->kind == NodeKind::kIdentifier
           && callee.children.front()->name == object;
}

class SafetyScanner final : public ast::AstVisitor
{
public:
    explicit SafetyScanner(Language language)
        : m_language(language)
    {}

    void enter(const Node& node) override
    {
        if (is_javascript_family(m_language)) {
            scan_javascript(node);
        } else {
            scan_python(node);
        }
    }

    [[nodiscard]] std::vector<std::string> take() { return std::move(m_warnings); }

private:
    void scan_javascript(const Node& node)
    {
        if (node.kind == NodeKind::kCall && callee_is_identifier(node, "eval")) {
            m_warnings.emplace_back("eval() usage detected - potential security risk");
        }
        if ((node.kind == NodeKind::kCall || node.kind == NodeKind::kNew)
            && callee_is_identifier(node, "Function")) {
            m_warnings.emplace_back("Function constructor usage detected - potential security risk");
        }
    }

    void scan_python(const Node& node)
    {
        if (node.kind == NodeKind::kCall) {
            if (callee_is_identifier(node, "eval")) {
                m_warnings.emplace_back("eval() usage detected - potential security risk");
            } else if (callee_is_identifier(node, "exec")) {
                m_warnings.emplace_back("exec() usage detected - potential security risk");
            } else if (callee_is_member_of(node, "os", "system")) {
                m_warnings.emplace_back("os.system() usage detected - potential security risk");
            }
            return;
        }
        if (node.kind == NodeKind::kImport) {
            const bool subprocess = std::ranges::any_of(node.children, [](const auto& module) {
                return module->text == "subprocess" || module->text.starts_with("subprocess.");
            });
            if (subprocess) {
                m_warnings.emplace_back("subprocess usage detected - potential security risk");
            }
        }
    }

    Language m_language;
    std::vector<std::string> m_warnings;
};

}  // namespace

CodeMetrics extract_metrics(const ast::Node& root, std::string_view code)
{
    CodeMetrics metrics;
    metrics.lines_of_code = common::count_non_blank_lines(code);
    metrics.complexity = 1;
    MetricsCollector collector(metrics);
    ast::walk(root, collector);
    return metrics;
}

std::vector<std::string> safety_warnings(const ast::Node& root, Language language)
{
    SafetyScanner scanner(language);
    ast::walk(root, scanner);
    return scanner.take();
}

double complexity_score(const CodeMetrics& metrics) noexcept
{
    const double base = std::min(static_cast<double>(metrics.complexity) / 10.0, 5.0);
    const double loops = std::min(static_cast<double>(metrics.loops.size()) * 0.5, 2.0);
    const double functions = std::min(static_cast<double>(metrics.functions) * 0.2, 2.0);
    const double size = std::min(static_cast<double>(metrics.lines_of_code) / 100.0, 1.0);
    return std::min(base + loops + functions + size, 10.0);
}

bool is_safe_for_execution(const AnalysisResult& analysis)
{
    if (!analysis.success) {
        return false;
    }
    constexpr std::array<std::string_view, 5> kCriticalPatterns = {
        "eval()", "exec()", "Function constructor", "subprocess", "os.system"};
    return std::ranges::none_of(analysis.warnings, [&](const std::string& warning) {
        return std::ranges::any_of(kCriticalPatterns, [&](std::string_view pattern) {
            return warning.contains(pattern);
        });
    });
}

}  // namespace secbox::analyzer
