#pragma once

#include <string>
#include "transfer_command.hpp"

enum class LineKind {
    Progress,   // percent holds an accepted value
    Ignored,    // looked like progress but was out of range, regressed, or per-file only
    Text,       // anything else, forwarded verbatim
};

struct ParsedLine {
    LineKind kind = LineKind::Text;
    int percent = -1;
};

// Turns copy tool output into an overall percent for one attempt.
// Accepted values never decrease; call reset() before each new attempt.
class ProgressParser {
public:
    explicit ProgressParser(CopyTool tool) : tool_(tool) {}

    ParsedLine parse(const std::string& line);
    void reset() { last_ = -1; }
    int last() const { return last_; }

private:
    ParsedLine accept(double value);
    ParsedLine parse_rsync(const std::string& line);
    ParsedLine parse_robocopy(const std::string& line);

    CopyTool tool_;
    int last_ = -1;
};
