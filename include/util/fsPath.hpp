#pragma once

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

inline fs::path makeAbsolute(const fs::path& path) {
    if (path.empty()) return "/";
    auto abs = fs::absolute(path).lexically_normal();
    if (abs.filename().empty() && abs != abs.root_path()) abs = abs.parent_path();
    return abs;
}

// True when candidate lies below root (never equal to it). The parent side is
// resolved through weakly_canonical so ".." segments and symlinked prefixes cannot
// escape; the last component itself is not followed, so a trashed symlink still
// counts as inside.
inline bool isStrictlyWithin(const fs::path& candidate, const fs::path& root) {
    const auto leaf = candidate.lexically_normal().filename();
    if (leaf.empty() || leaf == "." || leaf == "..") return false;

    std::error_code ec;
    const auto parent = fs::weakly_canonical(fs::absolute(candidate).lexically_normal().parent_path(), ec);
    if (ec) return false;
    const auto r = fs::weakly_canonical(root, ec);
    if (ec) return false;

    const auto rel = (parent / leaf).lexically_relative(r);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

inline std::string percentDecode(const std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(std::string(in.substr(i + 1, 2)), nullptr, 16)));
            i += 2;
        } else out.push_back(in[i]);
    }
    return out;
}
