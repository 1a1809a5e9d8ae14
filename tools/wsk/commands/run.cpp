/**
 * wsk CLI - run command
 *
 * Run one skill across packages and report per-package outcomes.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <mutex>
#include <thread>

namespace wsk::cli::commands {

namespace {

struct RunCommandOptions {
    std::string skill;
    std::vector<std::string> targets;
    size_t concurrency = 0;
    long long timeout_ms = 0;
    long long grace_ms = 0;
    int max_attempts = 0;
    bool retry_timeouts_only = false;
    bool only_affected = false;
    std::string artifacts_dir;
    bool show_output = false;
};

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted.store(true);
}

void print_outcome(const ExecutionOutcome& o, bool show_output) {
    const char* tag = "";
    switch (o.kind) {
        case OutcomeKind::Success: tag = "ok  "; break;
        case OutcomeKind::Failure: tag = "FAIL"; break;
        case OutcomeKind::SkippedUnsupported:
        case OutcomeKind::SkippedUpstreamFailure:
        case OutcomeKind::SkippedCancelled: tag = "skip"; break;
    }

    std::cout << "  " << tag << "  " << o.package;
    if (o.kind == OutcomeKind::Success || o.kind == OutcomeKind::Failure) {
        std::cout << " (" << format_duration(o.duration);
        if (o.attempts > 1) std::cout << ", " << o.attempts << " attempts";
        std::cout << ")";
    }
    if (!o.detail.empty()) {
        std::cout << ": " << o.detail;
    }
    std::cout << std::endl;

    if (o.kind == OutcomeKind::Failure && show_output) {
        std::string output = o.combined_output();
        if (!output.empty()) {
            std::cout << output;
            if (output.back() != '\n') std::cout << std::endl;
        }
    }
}

int cmd_run(const GlobalOptions& opts, const RunCommandOptions& run_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto& ws = opened.value();

    RunOptions options = ws->default_run_options();
    if (run_opts.concurrency > 0) options.concurrency = run_opts.concurrency;
    if (run_opts.timeout_ms > 0) options.timeout = std::chrono::milliseconds(run_opts.timeout_ms);
    if (run_opts.grace_ms > 0) options.grace_period = std::chrono::milliseconds(run_opts.grace_ms);
    if (run_opts.max_attempts > 0) options.retry.max_attempts = run_opts.max_attempts;
    if (run_opts.retry_timeouts_only) options.retry.only_timeouts = true;
    options.only_affected = run_opts.only_affected;

    std::mutex print_mutex;
    if (!opts.json && !opts.quiet) {
        bool show_output = run_opts.show_output || opts.verbose;
        options.on_outcome = [&print_mutex, show_output](const ExecutionOutcome& o) {
            std::lock_guard<std::mutex> lock(print_mutex);
            print_outcome(o, show_output);
        };
    }

    if (!run_opts.artifacts_dir.empty()) {
        WorkspaceConfig config = ws->config();
        config.artifacts_dir = resolve_path(".", run_opts.artifacts_dir);
        ws = Workspace::create(std::move(config));
    }

    // SIGINT cancels the run; a watcher forwards it outside signal context
    g_interrupted = false;
    auto previous = std::signal(SIGINT, handle_interrupt);
    std::atomic<bool> finished{false};
    Workspace* ws_ptr = ws.get();
    std::thread watcher([&finished, ws_ptr]() {
        while (!finished.load()) {
            if (g_interrupted.load()) {
                ws_ptr->cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto result = ws->run(run_opts.skill, to_target_set(run_opts.targets), options);

    finished = true;
    watcher.join();
    std::signal(SIGINT, previous);

    if (result.isErr()) {
        return report_error(result.error(), opts);
    }
    const RunReport& report = result.value();
    const RunSummary& summary = report.summary;

    if (opts.json) {
        nlohmann::json j = summary_to_json(summary, opts.verbose || run_opts.show_output);
        j["ok"] = summary.status == RunStatus::Success || summary.status == RunStatus::NoOp;
        j["artifacts"] = report.artifacts;
        if (!report.artifact_error.empty()) j["artifact_error"] = report.artifact_error;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << std::endl;
        std::cout << summary.skill << ": " << run_status_to_string(summary.status)
                  << " (" << summary.count(OutcomeKind::Success) << " succeeded, "
                  << summary.failed.size() << " failed, "
                  << summary.skipped.size() << " skipped) in "
                  << format_duration(summary.duration) << std::endl;
        for (const auto& path : report.artifacts) {
            std::cout << "  wrote " << path << std::endl;
        }
        if (!report.artifact_error.empty()) {
            print_error("artifacts: " + report.artifact_error, false);
        }
    }

    return exit_code_for(summary.status);
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunCommandOptions run_opts;

    app->add_option("skill", run_opts.skill, "Skill to run")->required();
    app->add_option("targets", run_opts.targets, "Target packages (default: all)");
    app->add_option("-j,--concurrency", run_opts.concurrency, "Parallel subprocesses");
    app->add_option("--timeout-ms", run_opts.timeout_ms, "Per-package timeout");
    app->add_option("--grace-ms", run_opts.grace_ms, "Wait between SIGTERM and SIGKILL");
    app->add_option("--max-attempts", run_opts.max_attempts, "Attempts per package, including the first");
    app->add_flag("--retry-timeouts-only", run_opts.retry_timeouts_only, "Only retry timed-out packages");
    app->add_flag("--only-affected", run_opts.only_affected, "Treat targets as changed; run what they affect");
    app->add_option("--artifacts", run_opts.artifacts_dir, "Write plan, walkthrough and summary here");
    app->add_flag("--show-output", run_opts.show_output, "Print output of failed packages");

    app->callback([&opts]() {
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace wsk::cli::commands
