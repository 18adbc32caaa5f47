#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>

struct SizeEstimate {
    uint64_t file_count = 0;
    uint64_t total_bytes = 0;
    uint64_t skipped = 0;       // files filtered out by the rules
    bool complete = true;       // false if part of the tree could not be read
};

// Walk the source tree and count what the rules would let through.
// Mode and destination state are not considered, so this is an upper bound.
Result<SizeEstimate> estimate_transfer_size(const SyncSpec& spec);

// Glob match in the copy tools' sense: '*' and '?' stay within one path
// component, '**' crosses them. Patterns without '/' match any one component;
// others match the path or one of its leading directories. A leading '/'
// anchors at the source root.
bool matches_glob(const std::string& rel_path, const std::string& pattern);
