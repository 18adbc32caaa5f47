#include "run_recorder.hpp"
#include "sync_log.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

RunRecorder::RunRecorder() : log_dir_(run_log_dir()) {}

RunRecorder::RunRecorder(fs::path log_dir) : log_dir_(std::move(log_dir)) {}

fs::path RunRecorder::log_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void RunRecorder::write_line(const std::string& line) {
    if (current_.empty()) return;
    std::ofstream f(current_, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << line << "\n";
    }
}

void RunRecorder::begin(const std::string& run_id, const std::string& job_name, bool dry_run) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) {
        sync_log(fmt::format("recorder: cannot create {}: {}", log_dir_.string(), ec.message()));
    }
    current_ = log_dir_ / (run_id + ".log");
    started_at_ = now_iso();
    write_line(fmt::format("START run={} job={} dry_run={}", run_id, job_name, dry_run));
}

void RunRecorder::record(const SyncEvent& event) {
    // The DONE line from finish() stands for the terminal event
    if (event.kind == EventKind::Done) return;
    std::lock_guard<std::mutex> lock(mutex_);
    write_line(fmt::format("{} {} {}", to_string(event.kind), event.percent, event.message));
}

void RunRecorder::finish(const RunSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : summary.warnings) {
        write_line("WARNING " + w);
    }
    write_line(fmt::format("DONE outcome={} duration={} succeeded={} failed={} message={}",
                           summary.outcome, format_duration(started_at_, summary.finished_at),
                           summary.sources_succeeded, summary.sources_failed, summary.message));
}
