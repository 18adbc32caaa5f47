#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// What is kept about a finished run.
struct RunSummary {
    std::string run_id;
    std::string job_name;
    std::string started_at;         // ISO timestamps
    std::string finished_at;
    std::string outcome;            // "success", "failure", "cancelled"
    std::string message;
    int sources_succeeded = 0;
    int sources_failed = 0;
    bool dry_run = false;
    std::string log_path;
    std::vector<std::string> warnings;
};

// Archive of finished runs in ~/.sharesync/history.yaml, newest last,
// trimmed to HISTORY_MAX_RUNS.
class RunHistory {
public:
    RunHistory();
    explicit RunHistory(fs::path path);

    std::vector<RunSummary> load() const;
    void append(const RunSummary& summary);
    void clear();

    const fs::path& path() const { return path_; }

private:
    void save(const std::vector<RunSummary>& runs) const;

    fs::path path_;
};
