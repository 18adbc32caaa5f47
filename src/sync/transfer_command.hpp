#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// External copy tool driven for a transfer.
enum class CopyTool { Rsync, Robocopy };

// robocopy on Windows, rsync everywhere else.
CopyTool default_copy_tool();
const char* tool_program(CopyTool tool);

struct TransferCommand {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::string> notes;     // options the tool cannot honor, reported as status
};

// Translate a spec into the tool's command line. Pure; does not touch the filesystem.
TransferCommand build_transfer_command(const SyncSpec& spec, bool dry_run, CopyTool tool);

enum class ExitClass { Success, Transient, Fatal };

// rsync: 0 ok, 24 (files vanished) transient, anything else fatal.
// robocopy: 0-7 ok, >= 8 fatal.
ExitClass classify_exit(CopyTool tool, int exit_code);

// Human readable explanation of a tool exit code for failure messages.
std::string describe_exit(CopyTool tool, int exit_code);
