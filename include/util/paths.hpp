#pragma once

#include <filesystem>

namespace nx::paths {

// $NEXUS_CONFIG, else $XDG_CONFIG_HOME/nexus/config.yaml, else ~/.config/nexus/config.yaml
std::filesystem::path getConfigPath();

// $XDG_STATE_HOME/nexus, else ~/.local/state/nexus
std::filesystem::path getLogPath();

// $XDG_DATA_HOME/nexus/trash, else ~/.local/share/nexus/trash
std::filesystem::path getTrashRoot();

// freedesktop home trash: $XDG_DATA_HOME/Trash, else ~/.local/share/Trash.
// Empty where the platform has no such location.
std::filesystem::path getSystemTrashRoot();

// Redirects every location above under root. Used by the test harness only.
void setTestingRoot(const std::filesystem::path& root);

[[nodiscard]] bool isTesting();

}
