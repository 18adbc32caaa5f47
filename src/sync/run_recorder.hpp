#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include "run_history.hpp"
#include "sync_event.hpp"

// Append-only record of one run: ~/.sharesync/logs/<run_id>.log
//
//   [2025-01-15T14:35:02] START run=20250115_143502_a1f3 job=fhnw dry_run=false
//   [2025-01-15T14:35:03] status -1 Connecting to VPN...
//   [2025-01-15T14:35:10] progress 50 Transferring 1 of 2
//   [2025-01-15T14:35:40] DONE outcome=success duration=38s succeeded=2 failed=0
//
// The DONE record is always the last line. Writes are serialized; the recorder may be fed from the run's worker
// while the caller reads log_path().
class RunRecorder {
public:
    RunRecorder();
    explicit RunRecorder(fs::path log_dir);

    void begin(const std::string& run_id, const std::string& job_name, bool dry_run);
    void record(const SyncEvent& event);
    void finish(const RunSummary& summary);

    fs::path log_path() const;
    const fs::path& log_dir() const { return log_dir_; }

private:
    void write_line(const std::string& line);

    fs::path log_dir_;
    mutable std::mutex mutex_;
    fs::path current_;
    std::string started_at_;
};
