#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <random>
#include <sstream>
#include <stdexcept>
#include <fmt/format.h>

static struct tm local_tm(std::time_t t) {
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

std::string now_iso() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf = local_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string make_run_id() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf = local_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);

    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 0xffff);
    return fmt::format("{}_{:04x}", buf, dist(rng));
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split_trimmed(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string piece;
    while (std::getline(iss, piece, sep)) {
        trim(piece);
        if (!piece.empty()) out.push_back(piece);
    }
    return out;
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    auto quote = [](const std::string& a) {
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
            return "\"" + a + "\"";
        }
        return a;
    };

    std::string out = quote(program);
    for (const auto& a : args) {
        out += " " + quote(a);
    }
    return out;
}
