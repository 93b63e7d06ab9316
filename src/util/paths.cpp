#include "util/paths.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace nx::paths {

namespace {

std::optional<fs::path> testingRoot;

std::optional<std::string> env(const char* name) {
    if (const char* v = std::getenv(name); v && *v) return std::string(v);
    return std::nullopt;
}

fs::path homeDir() {
    if (const auto home = env("HOME")) return *home;
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return fs::temp_directory_path();
}

fs::path xdgDir(const char* var, const fs::path& fallbackRel) {
    if (const auto dir = env(var)) return *dir;
    return homeDir() / fallbackRel;
}

}

fs::path getConfigPath() {
    if (testingRoot) return *testingRoot / "config.yaml";
    if (const auto explicitPath = env("NEXUS_CONFIG")) return *explicitPath;
    return xdgDir("XDG_CONFIG_HOME", ".config") / "nexus" / "config.yaml";
}

fs::path getLogPath() {
    if (testingRoot) return *testingRoot / "log";
    return xdgDir("XDG_STATE_HOME", ".local/state") / "nexus";
}

fs::path getTrashRoot() {
    if (testingRoot) return *testingRoot / "trash";
    return xdgDir("XDG_DATA_HOME", ".local/share") / "nexus" / "trash";
}

fs::path getSystemTrashRoot() {
    if (testingRoot) return *testingRoot / "system-trash";
#ifdef __linux__
    return xdgDir("XDG_DATA_HOME", ".local/share") / "Trash";
#else
    return {};
#endif
}

void setTestingRoot(const fs::path& root) { testingRoot = root; }

bool isTesting() { return testingRoot.has_value(); }

}
