#include "size_estimate.hpp"
#include "sync_log.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// ── Glob matching ───────────────────────────────────────────

static std::string glob_to_regex(const std::string& glob) {
    std::string regex;
    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                regex += ".*";
                i++;
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[' || c == ']') {
            regex += c;
        } else if (std::string(".^$+(){}|\\").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }
    return regex;
}

bool matches_glob(const std::string& rel_path, const std::string& pattern) {
    if (pattern.empty()) return false;

    std::string pat = pattern;
    if (pat.back() == '/') pat.pop_back();
    bool anchored = !pat.empty() && pat.front() == '/';
    if (anchored) pat.erase(0, 1);
    if (pat.empty()) return false;
    bool by_component = !anchored && pat.find('/') == std::string::npos;

    std::regex re;
    try {
        re = std::regex(glob_to_regex(pat));
    } catch (const std::regex_error&) {
        return false;
    }

    // A match on a leading directory covers everything below it
    size_t start = 0;
    while (true) {
        size_t slash = rel_path.find('/', start);
        std::string subject = by_component
            ? rel_path.substr(start, slash == std::string::npos ? std::string::npos : slash - start)
            : rel_path.substr(0, slash);
        if (std::regex_match(subject, re)) return true;
        if (slash == std::string::npos) return false;
        start = slash + 1;
    }
}

// ── Estimate ────────────────────────────────────────────────

static bool has_hidden_component(const fs::path& rel) {
    for (const auto& part : rel) {
        auto s = part.string();
        if (!s.empty() && s[0] == '.' && s != "." && s != "..") return true;
    }
    return false;
}

static bool rule_admits(const SyncRule& rules, const std::string& rel, int64_t size) {
    for (const auto& p : rules.include_patterns) {
        if (matches_glob(rel, p)) return true;
    }
    for (const auto& p : rules.exclude_patterns) {
        if (matches_glob(rel, p)) return false;
    }
    if (rules.exclude_hidden && has_hidden_component(rel)) return false;

    if (!rules.file_extensions.empty()) {
        bool ok = false;
        for (const auto& ext : rules.file_extensions) {
            if (rel.size() >= ext.size() &&
                rel.compare(rel.size() - ext.size(), ext.size(), ext) == 0) {
                ok = true;
                break;
            }
        }
        if (!ok) return false;
    }

    if (rules.min_file_size && size < *rules.min_file_size) return false;
    if (rules.max_file_size && size > *rules.max_file_size) return false;
    return true;
}

Result<SizeEstimate> estimate_transfer_size(const SyncSpec& spec) {
    std::error_code ec;
    fs::path root(spec.source.path);
    if (!fs::is_directory(root, ec)) {
        return Result<SizeEstimate>::Err(
            fmt::format("Source is not a readable directory: {}", spec.source.path));
    }

    SizeEstimate est;
    auto opts = spec.follow_symlinks ? fs::directory_options::follow_directory_symlink
                                     : fs::directory_options::none;
    opts |= fs::directory_options::skip_permission_denied;

    fs::recursive_directory_iterator it(root, opts, ec);
    if (ec) {
        return Result<SizeEstimate>::Err(
            fmt::format("Cannot read {}: {}", spec.source.path, ec.message()));
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        std::string rel = fs::relative(it->path(), root, fec).generic_string();
        if (fec) {
            est.complete = false;
            continue;
        }
        auto size = static_cast<int64_t>(it->file_size(fec));
        if (fec) {
            est.complete = false;
            continue;
        }

        if (rule_admits(spec.rules, rel, size)) {
            est.file_count++;
            est.total_bytes += static_cast<uint64_t>(size);
        } else {
            est.skipped++;
        }
    }
    // increment() leaves the iterator at end on a read error
    if (ec) est.complete = false;

    sync_log(fmt::format("estimate: {} files, {} bytes, {} skipped in {}",
                         est.file_count, est.total_bytes, est.skipped, spec.source.path));
    return Result<SizeEstimate>::Ok(est);
}
