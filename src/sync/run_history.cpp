#include "run_history.hpp"
#include "sync_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>

RunHistory::RunHistory()
    : path_(platform::home_dir() / ".sharesync" / "history.yaml") {}

RunHistory::RunHistory(fs::path path) : path_(std::move(path)) {}

std::vector<RunSummary> RunHistory::load() const {
    std::vector<RunSummary> runs;

    try {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            if (ec) sync_log(fmt::format("history: cannot stat {}: {}", path_.string(), ec.message()));
            return runs;
        }
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["runs"] && root["runs"].IsSequence()) {
            for (const auto& n : root["runs"]) {
                RunSummary r;
                r.run_id = n["run_id"].as<std::string>("");
                r.job_name = n["job"].as<std::string>("");
                r.started_at = n["started_at"].as<std::string>("");
                r.finished_at = n["finished_at"].as<std::string>("");
                r.outcome = n["outcome"].as<std::string>("");
                r.message = n["message"].as<std::string>("");
                r.sources_succeeded = n["succeeded"].as<int>(0);
                r.sources_failed = n["failed"].as<int>(0);
                r.dry_run = n["dry_run"].as<bool>(false);
                r.log_path = n["log"].as<std::string>("");
                if (n["warnings"] && n["warnings"].IsSequence()) {
                    for (const auto& w : n["warnings"]) {
                        r.warnings.push_back(w.as<std::string>(""));
                    }
                }
                runs.push_back(r);
            }
        }
    } catch (const std::exception& e) {
        // Corrupted history, start over rather than block runs
        sync_log(std::string("history: unreadable, ignoring: ") + e.what());
        return {};
    }

    return runs;
}

void RunHistory::append(const RunSummary& summary) {
    auto runs = load();
    runs.push_back(summary);
    if (runs.size() > HISTORY_MAX_RUNS) {
        runs.erase(runs.begin(), runs.end() - static_cast<std::ptrdiff_t>(HISTORY_MAX_RUNS));
    }
    save(runs);
}

void RunHistory::clear() {
    save({});
}

void RunHistory::save(const std::vector<RunSummary>& runs) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "runs" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : runs) {
        out << YAML::BeginMap;
        out << YAML::Key << "run_id" << YAML::Value << r.run_id;
        out << YAML::Key << "job" << YAML::Value << r.job_name;
        out << YAML::Key << "started_at" << YAML::Value << r.started_at;
        out << YAML::Key << "finished_at" << YAML::Value << r.finished_at;
        out << YAML::Key << "outcome" << YAML::Value << r.outcome;
        out << YAML::Key << "message" << YAML::Value << r.message;
        out << YAML::Key << "succeeded" << YAML::Value << r.sources_succeeded;
        out << YAML::Key << "failed" << YAML::Value << r.sources_failed;
        out << YAML::Key << "dry_run" << YAML::Value << r.dry_run;
        out << YAML::Key << "log" << YAML::Value << r.log_path;
        if (!r.warnings.empty()) {
            out << YAML::Key << "warnings" << YAML::Value << YAML::BeginSeq;
            for (const auto& w : r.warnings) out << w;
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        sync_log("history: cannot write " + path_.string());
        return;
    }
    fout << out.c_str() << "\n";
}
