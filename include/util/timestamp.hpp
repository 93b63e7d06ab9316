#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace nx::util {

inline int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t toMillis(const std::filesystem::file_time_type ft) {
    using namespace std::chrono;
    const auto sys = file_clock::to_sys(ft);
    return duration_cast<milliseconds>(sys.time_since_epoch()).count();
}

// freedesktop .trashinfo DeletionDate: "YYYY-MM-DDThh:mm:ss" in local time
inline std::optional<int64_t> parseLocalIsoMillis(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return static_cast<int64_t>(t) * 1000;
}

} // namespace nx::util
