#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsk {

// ============================================================================
// Package
// ============================================================================

struct Package {
    std::string name;
    std::vector<std::string> dependencies;  // sorted, unique
    std::vector<std::string> capabilities;  // skill names this package supports
    std::string path;                       // relative to workspace root; defaults to name
    std::unordered_map<std::string, std::string> metadata;
    std::string source_path;                // manifest file it came from

    bool has_capability(const std::string& capability) const;
};

// ============================================================================
// Outcome Kind
// ============================================================================

enum class OutcomeKind {
    Success,
    Failure,
    SkippedUnsupported,
    SkippedUpstreamFailure,
    SkippedCancelled,
};

inline const char* outcome_kind_to_string(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::Failure: return "failure";
        case OutcomeKind::SkippedUnsupported: return "skipped-unsupported";
        case OutcomeKind::SkippedUpstreamFailure: return "skipped-upstream-failure";
        case OutcomeKind::SkippedCancelled: return "skipped-cancelled";
    }
    return "failure";
}

std::optional<OutcomeKind> parse_outcome_kind(const std::string& s);

inline bool is_skipped(OutcomeKind k) {
    return k == OutcomeKind::SkippedUnsupported ||
           k == OutcomeKind::SkippedUpstreamFailure ||
           k == OutcomeKind::SkippedCancelled;
}

// ============================================================================
// Failure Reason
// ============================================================================

enum class FailureReason {
    None,
    NonZeroExit,
    Timeout,
    SpawnError,
    Cancelled,
    Classified,  // success exit code overridden by a classifier rule
};

inline const char* failure_reason_to_string(FailureReason r) {
    switch (r) {
        case FailureReason::None: return "none";
        case FailureReason::NonZeroExit: return "nonzero-exit";
        case FailureReason::Timeout: return "timeout";
        case FailureReason::SpawnError: return "spawn-error";
        case FailureReason::Cancelled: return "cancelled";
        case FailureReason::Classified: return "classified";
    }
    return "none";
}

// ============================================================================
// Run Status
// ============================================================================

enum class RunStatus {
    Success,
    Failure,
    NoOp,
    Cancelled,
};

inline const char* run_status_to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Success: return "success";
        case RunStatus::Failure: return "failure";
        case RunStatus::NoOp: return "no-op";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "failure";
}

// ============================================================================
// Execution Outcome
// ============================================================================

enum class OutputStream {
    Stdout,
    Stderr,
};

// One read from a subprocess pipe; the sequence keeps stdout/stderr interleaving
struct OutputChunk {
    OutputStream stream = OutputStream::Stdout;
    std::string text;
};

struct ExecutionOutcome {
    std::string package;
    std::string skill;
    OutcomeKind kind = OutcomeKind::Failure;
    FailureReason reason = FailureReason::None;
    std::optional<int> exit_code;
    std::string category;  // classifier category, e.g. "compiler error"
    std::string detail;    // human-readable explanation for skips and failures
    std::string stdout_text;
    std::string stderr_text;
    std::vector<OutputChunk> output;
    std::vector<std::string> command;
    std::string working_directory;
    std::chrono::milliseconds duration{0};
    int attempts = 0;

    // Interleaved stdout/stderr as it was produced
    std::string combined_output() const;
};

// ============================================================================
// Run Summary
// ============================================================================

struct SkippedPackage {
    std::string package;
    OutcomeKind kind = OutcomeKind::SkippedUnsupported;
    std::string reason;
};

struct RunSummary {
    std::string skill;
    RunStatus status = RunStatus::NoOp;
    std::vector<std::string> targets;
    std::vector<ExecutionOutcome> outcomes;  // plan order
    std::vector<std::string> failed;
    std::vector<SkippedPackage> skipped;
    std::string started_at;   // RFC3339
    std::string finished_at;  // RFC3339
    std::chrono::milliseconds duration{0};

    const ExecutionOutcome* find(const std::string& package) const;
    size_t count(OutcomeKind kind) const;
};

} // namespace wsk
