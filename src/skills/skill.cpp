#include "wsk/skill.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>

#include <spdlog/spdlog.h>

namespace wsk {

namespace {

// Only the tail of each stream is classified, one bounded line at a time;
// std::regex recursion grows with the input length
constexpr size_t kMaxClassifiedBytes = 64 * 1024;
constexpr size_t kMaxClassifiedLine = 1024;

bool search_lines(const std::string& text, const std::regex& re) {
    size_t pos = text.size() > kMaxClassifiedBytes ? text.size() - kMaxClassifiedBytes : 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) end = text.size();
        size_t len = std::min(end - pos, kMaxClassifiedLine);
        auto first = text.begin() + static_cast<std::ptrdiff_t>(pos);
        if (std::regex_search(first, first + static_cast<std::ptrdiff_t>(len), re)) {
            return true;
        }
        pos = end + 1;
    }
    return false;
}

bool rule_matches(const ClassifierRule& rule,
                  const std::string& stdout_text,
                  const std::string& stderr_text) {
    try {
        std::regex re(rule.pattern, std::regex::ECMAScript);
        switch (rule.stream) {
            case ClassifierStream::Stdout:
                return search_lines(stdout_text, re);
            case ClassifierStream::Stderr:
                return search_lines(stderr_text, re);
            case ClassifierStream::Any:
                return search_lines(stdout_text, re) || search_lines(stderr_text, re);
        }
    } catch (const std::regex_error& e) {
        spdlog::warn("classifier pattern '{}' failed: {}", rule.pattern, e.what());
    }
    return false;
}

bool needs_quoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char c : arg) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) ||
                    c == '-' || c == '_' || c == '.' || c == '/' || c == '=' ||
                    c == ':' || c == ',' || c == '+' || c == '@' || c == '%';
        if (!safe) return true;
    }
    return false;
}

} // namespace

std::optional<ClassifierStream> parse_classifier_stream(const std::string& s) {
    if (s == "any" || s.empty()) return ClassifierStream::Any;
    if (s == "stdout") return ClassifierStream::Stdout;
    if (s == "stderr") return ClassifierStream::Stderr;
    return std::nullopt;
}

std::vector<std::string> Skill::required_capabilities() const {
    if (requires_capabilities.empty()) {
        return {name};
    }
    return requires_capabilities;
}

bool Skill::applies_to(const Package& package) const {
    for (const auto& capability : required_capabilities()) {
        if (!package.has_capability(capability)) {
            return false;
        }
    }
    return true;
}

bool Skill::is_success_code(int exit_code) const {
    return std::find(success_exit_codes.begin(), success_exit_codes.end(), exit_code) !=
           success_exit_codes.end();
}

Classification Skill::classify(int exit_code,
                               const std::string& stdout_text,
                               const std::string& stderr_text) const {
    Classification result;

    if (is_success_code(exit_code)) {
        for (const auto& rule : classifiers) {
            if (rule.force_failure && rule_matches(rule, stdout_text, stderr_text)) {
                result.success = false;
                result.forced = true;
                result.category = rule.category;
                return result;
            }
        }
        return result;
    }

    result.success = false;
    for (const auto& rule : classifiers) {
        if (rule_matches(rule, stdout_text, stderr_text)) {
            result.category = rule.category;
            break;
        }
    }
    return result;
}

std::string expand_template(const std::string& tmpl,
                            const TemplateVars& vars,
                            const EnvironmentContext& env) {
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }

        out.append(tmpl, pos, open - pos);
        std::string key = tmpl.substr(open + 1, close - open - 1);

        if (key == "package") {
            out += vars.package;
        } else if (key == "package_path") {
            out += vars.package_path;
        } else if (key == "workspace") {
            out += vars.workspace;
        } else if (key == "skill") {
            out += vars.skill;
        } else if (key.rfind("env:", 0) == 0) {
            out += env.get(key.substr(4)).value_or("");
        } else {
            out.append(tmpl, open, close - open + 1);
        }

        pos = close + 1;
    }

    return out;
}

std::vector<std::string> expand_command(const Skill& skill,
                                        const TemplateVars& vars,
                                        const EnvironmentContext& env) {
    std::vector<std::string> argv;
    argv.reserve(skill.command.size());
    for (const auto& part : skill.command) {
        argv.push_back(expand_template(part, vars, env));
    }
    return argv;
}

std::string shell_join(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out += ' ';
        const auto& arg = argv[i];
        if (!needs_quoting(arg)) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

} // namespace wsk
