#include "transfer_command.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

CopyTool default_copy_tool() {
#ifdef _WIN32
    return CopyTool::Robocopy;
#else
    return CopyTool::Rsync;
#endif
}

const char* tool_program(CopyTool tool) {
    return tool == CopyTool::Robocopy ? "robocopy" : "rsync";
}

// ── rsync ───────────────────────────────────────────────────

static TransferCommand build_rsync(const SyncSpec& spec, bool dry_run) {
    TransferCommand cmd;
    cmd.program = "rsync";
    auto& a = cmd.args;

    a.push_back("-rv");
    a.push_back("--progress");
    if (dry_run) a.push_back("--dry-run");

    switch (spec.mode) {
        case SyncMode::Mirror:   a.push_back("--delete"); break;
        case SyncMode::Update:   a.push_back("--update"); break;
        case SyncMode::Additive: a.push_back("--ignore-existing"); break;
    }

    if (spec.preserve_permissions) a.push_back("-p");
    if (spec.preserve_timestamps) a.push_back("-t");
    a.push_back(spec.follow_symlinks ? "-L" : "-l");

    if (spec.bandwidth_limit_kbs) {
        a.push_back(fmt::format("--bwlimit={}", *spec.bandwidth_limit_kbs));
    }

    // rsync applies the first matching rule, so includes go first
    const auto& rules = spec.rules;
    for (const auto& p : rules.include_patterns) a.push_back("--include=" + p);
    for (const auto& p : rules.exclude_patterns) a.push_back("--exclude=" + p);
    if (rules.exclude_hidden) a.push_back("--exclude=.*");

    if (!rules.file_extensions.empty()) {
        a.push_back("--include=*/");
        for (const auto& ext : rules.file_extensions) a.push_back("--include=*" + ext);
        a.push_back("--exclude=*");
    }

    if (rules.min_file_size) a.push_back(fmt::format("--min-size={}", *rules.min_file_size));
    if (rules.max_file_size) a.push_back(fmt::format("--max-size={}", *rules.max_file_size));

    // Trailing slash: copy the contents of source, not the directory itself
    std::string src = spec.source.path;
    if (src.empty() || src.back() != '/') src += '/';
    a.push_back(src);
    a.push_back(spec.destination.path);
    return cmd;
}

// ── robocopy ────────────────────────────────────────────────

static TransferCommand build_robocopy(const SyncSpec& spec, bool dry_run) {
    TransferCommand cmd;
    cmd.program = "robocopy";
    auto& a = cmd.args;
    const auto& rules = spec.rules;

    a.push_back(spec.source.path);
    a.push_back(spec.destination.path);

    std::vector<std::string> filters;
    for (const auto& ext : rules.file_extensions) filters.push_back("*" + ext);
    for (const auto& p : rules.include_patterns) filters.push_back(p);
    if (filters.empty()) filters.push_back("*.*");
    a.insert(a.end(), filters.begin(), filters.end());

    a.push_back("/E");

    switch (spec.mode) {
        case SyncMode::Mirror:
            a.push_back("/MIR");
            break;
        case SyncMode::Update:
            a.push_back("/XO");
            break;
        case SyncMode::Additive:
            a.push_back("/XC");
            a.push_back("/XN");
            a.push_back("/XO");
            break;
    }

    if (dry_run) a.push_back("/L");

    std::string copy = spec.preserve_timestamps ? "/COPY:DAT" : "/COPY:DA";
    if (spec.preserve_permissions) copy += "S";
    a.push_back(copy);

    if (!spec.follow_symlinks) a.push_back("/SL");

    if (!rules.exclude_patterns.empty()) {
        a.push_back("/XF");
        a.insert(a.end(), rules.exclude_patterns.begin(), rules.exclude_patterns.end());
    }
    if (rules.exclude_hidden) a.push_back("/XA:H");

    if (rules.min_file_size) a.push_back(fmt::format("/MIN:{}", *rules.min_file_size));
    if (rules.max_file_size) a.push_back(fmt::format("/MAX:{}", *rules.max_file_size));

    a.push_back(fmt::format("/R:{}", spec.retry_count));
    a.push_back("/W:1");

    if (spec.bandwidth_limit_kbs) {
        cmd.notes.push_back(fmt::format(
            "robocopy has no bandwidth throttle; ignoring limit of {} KB/s",
            *spec.bandwidth_limit_kbs));
    }
    return cmd;
}

TransferCommand build_transfer_command(const SyncSpec& spec, bool dry_run, CopyTool tool) {
    return tool == CopyTool::Robocopy ? build_robocopy(spec, dry_run)
                                      : build_rsync(spec, dry_run);
}

// ── Exit codes ──────────────────────────────────────────────

ExitClass classify_exit(CopyTool tool, int exit_code) {
    if (tool == CopyTool::Robocopy) {
        if (exit_code >= 0 && exit_code < ROBOCOPY_FATAL_THRESHOLD) return ExitClass::Success;
        return ExitClass::Fatal;
    }
    if (exit_code == RSYNC_EXIT_OK) return ExitClass::Success;
    if (exit_code == RSYNC_EXIT_VANISHED) return ExitClass::Transient;
    return ExitClass::Fatal;
}

std::string describe_exit(CopyTool tool, int exit_code) {
    if (exit_code == PROCESS_EXIT_SIGNALED) return "terminated by a signal";
    if (tool == CopyTool::Robocopy) {
        if (exit_code >= 16) return fmt::format("exit code {}: serious error, nothing copied", exit_code);
        if (exit_code >= 8) return fmt::format("exit code {}: some files could not be copied", exit_code);
        return fmt::format("exit code {}", exit_code);
    }
    switch (exit_code) {
        case 1:  return "exit code 1: syntax or usage error";
        case 11: return "exit code 11: error in file I/O";
        case 12: return "exit code 12: error in protocol data stream";
        case 23: return "exit code 23: partial transfer due to error";
        case 24: return "exit code 24: some source files vanished";
        default: return fmt::format("exit code {}", exit_code);
    }
}
