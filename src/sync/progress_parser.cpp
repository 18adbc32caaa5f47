#include "progress_parser.hpp"
#include <regex>
#include <cmath>

// ── Parsing ─────────────────────────────────────────────────

ParsedLine ProgressParser::parse(const std::string& line) {
    return tool_ == CopyTool::Robocopy ? parse_robocopy(line) : parse_rsync(line);
}

ParsedLine ProgressParser::accept(double value) {
    if (value < 0.0 || value > 100.0) return {LineKind::Ignored, -1};
    int pct = static_cast<int>(std::floor(value));
    if (pct < last_) return {LineKind::Ignored, -1};
    last_ = pct;
    return {LineKind::Progress, pct};
}

// "     1,234,567  45%  1.23MB/s    0:00:01 (xfr#3, to-chk=17/40)"
// Only the to-chk / ir-chk counters describe the whole transfer; the bare
// per-file percentage is dropped so it does not flood the event stream.
ParsedLine ProgressParser::parse_rsync(const std::string& line) {
    static const std::regex chk_re(R"((?:to|ir)-chk=(\d{1,12})/(\d{1,12}))");
    static const std::regex file_re(R"(^\s*[\d,.]+[KMGT]?\s+\d{1,3}%\s)");

    std::smatch m;
    if (std::regex_search(line, m, chk_re)) {
        long remaining = std::stol(m[1].str());
        long total = std::stol(m[2].str());
        if (total <= 0 || remaining > total) return {LineKind::Ignored, -1};
        return accept(static_cast<double>((total - remaining) * 100 / total));
    }
    if (std::regex_search(line, file_re)) return {LineKind::Ignored, -1};
    return {LineKind::Text, -1};
}

// robocopy prints a bare "  12.5%" (or "100%") line while copying a file.
ParsedLine ProgressParser::parse_robocopy(const std::string& line) {
    static const std::regex pct_re(R"(^\s*(\d{1,6}(?:\.\d+)?)%\s*$)");

    std::smatch m;
    if (std::regex_match(line, m, pct_re)) {
        return accept(std::stod(m[1].str()));
    }
    return {LineKind::Text, -1};
}
