#include "wsk/types.hpp"

#include <algorithm>
#include <cctype>

namespace wsk {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

bool Package::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

std::optional<OutcomeKind> parse_outcome_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "success") return OutcomeKind::Success;
    if (lower == "failure") return OutcomeKind::Failure;
    if (lower == "skipped-unsupported") return OutcomeKind::SkippedUnsupported;
    if (lower == "skipped-upstream-failure") return OutcomeKind::SkippedUpstreamFailure;
    if (lower == "skipped-cancelled") return OutcomeKind::SkippedCancelled;
    return std::nullopt;
}

std::string ExecutionOutcome::combined_output() const {
    std::string result;
    for (const auto& chunk : output) {
        result += chunk.text;
    }
    return result;
}

const ExecutionOutcome* RunSummary::find(const std::string& package) const {
    for (const auto& outcome : outcomes) {
        if (outcome.package == package) {
            return &outcome;
        }
    }
    return nullptr;
}

size_t RunSummary::count(OutcomeKind kind) const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [kind](const ExecutionOutcome& o) { return o.kind == kind; }));
}

} // namespace wsk
