#pragma once

#include "wsk/result.hpp"
#include "wsk/skill.hpp"

#include <map>
#include <string>
#include <vector>

namespace wsk {

/**
 * @brief Name -> Skill catalog
 *
 * Skills are registered once, validated on the way in, and never change
 * afterwards. Pointers returned by resolve() stay valid for the registry's
 * lifetime.
 */
class SkillRegistry {
public:
    /// Fails with DUPLICATE_SKILL or INVALID_SKILL
    Result<void> register_skill(Skill skill);

    /// Fails with UNKNOWN_SKILL
    Result<const Skill*> resolve(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return skills_.size(); }

    /// Register a whole catalog; stops at the first invalid entry
    static Result<SkillRegistry> from_skills(std::vector<Skill> skills);

private:
    std::map<std::string, Skill> skills_;
};

} // namespace wsk
