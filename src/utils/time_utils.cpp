#include "utils/time_utils.hpp"
#include "common/errors.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <algorithm>

namespace settle {
namespace time_utils {

std::string to_iso8601(int64_t epoch_ms) {
    auto tp = WallClock(std::chrono::milliseconds(epoch_ms));
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    int64_t ms = epoch_ms % 1000;
    if (ms < 0) ms += 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

int64_t from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw InvalidRequestError("Malformed ISO 8601 timestamp: '" + s + "'");
    }

    int64_t ms = 0;
    std::string rest;
    std::getline(ss, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 3) ms = ms * 10 + (rest[pos] - '0');
            digits++;
            pos++;
        }
        if (digits == 0) {
            throw InvalidRequestError("Malformed ISO 8601 fraction: '" + s + "'");
        }
        for (int i = digits; i < 3; i++) ms *= 10;
    }
    if (pos < rest.size() && rest[pos] == 'Z') pos++;
    if (pos != rest.size()) {
        throw InvalidRequestError("Unsupported ISO 8601 suffix: '" + s + "'");
    }

    std::time_t seconds = timegm(&tm);
    return static_cast<int64_t>(seconds) * 1000 + ms;
}

std::string format_duration(Duration d) {
    auto ns = d.count();

    if (ns < 1000) {
        return std::to_string(ns) + "ns";
    } else if (ns < 1000000) {
        return std::to_string(ns / 1000) + "us";
    } else if (ns < 1000000000) {
        return std::to_string(ns / 1000000) + "ms";
    } else {
        double sec = static_cast<double>(ns) / 1e9;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << sec << "s";
        return ss.str();
    }
}

std::chrono::milliseconds backoff_delay(int attempt, int initial_ms, int max_ms) {
    int64_t delay = initial_ms;
    for (int i = 0; i < attempt && delay < max_ms; i++) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<int64_t>(delay, max_ms));
}

} // namespace time_utils
} // namespace settle
