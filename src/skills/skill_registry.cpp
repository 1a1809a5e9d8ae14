#include "wsk/skill_registry.hpp"

#include <regex>

#include <spdlog/spdlog.h>

namespace wsk {

Result<void> SkillRegistry::register_skill(Skill skill) {
    if (skill.name.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_SKILL, "skill without a name"));
    }
    if (skills_.count(skill.name)) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_SKILL,
                                       "skill already registered: " + skill.name));
    }
    if (skill.command.empty() || skill.command.front().empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_SKILL,
                                       "skill " + skill.name + " has an empty command"));
    }
    if (skill.success_exit_codes.empty()) {
        skill.success_exit_codes.push_back(0);
    }
    for (const auto& rule : skill.classifiers) {
        try {
            std::regex re(rule.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return Result<void>::err(Error(ErrorCode::INVALID_SKILL,
                "skill " + skill.name + " has invalid classifier pattern '" +
                rule.pattern + "': " + e.what()));
        }
    }

    spdlog::debug("registered skill {}", skill.name);
    std::string name = skill.name;
    skills_.emplace(std::move(name), std::move(skill));
    return Result<void>::ok();
}

Result<const Skill*> SkillRegistry::resolve(const std::string& name) const {
    auto it = skills_.find(name);
    if (it == skills_.end()) {
        return Result<const Skill*>::err(Error(ErrorCode::UNKNOWN_SKILL,
                                               "unknown skill: " + name));
    }
    return Result<const Skill*>::ok(&it->second);
}

bool SkillRegistry::contains(const std::string& name) const {
    return skills_.count(name) > 0;
}

std::vector<std::string> SkillRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(skills_.size());
    for (const auto& [name, skill] : skills_) {
        result.push_back(name);
    }
    return result;
}

Result<SkillRegistry> SkillRegistry::from_skills(std::vector<Skill> skills) {
    SkillRegistry registry;
    for (auto& skill : skills) {
        auto registered = registry.register_skill(std::move(skill));
        if (registered.isErr()) {
            return Result<SkillRegistry>::err(registered.error());
        }
    }
    return Result<SkillRegistry>::ok(std::move(registry));
}

} // namespace wsk
