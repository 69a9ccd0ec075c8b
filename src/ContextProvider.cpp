/**
 * ContextProvider.cpp - Candidate lists for filesystem, VCS, package and process completions
 */

#include "hint/ContextProvider.hpp"
#include "hint/CommandParser.hpp"
#include "hint/Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace hint {

namespace {

std::string expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

} // anonymous namespace

FilesystemContextProvider::FilesystemContextProvider(size_t max_entries)
    : max_entries_(max_entries) {}

std::vector<ContextCandidate> FilesystemContextProvider::candidates(ContextKind kind,
                                                                    const std::string& prefix,
                                                                    const std::string& directory) {
    std::vector<ContextCandidate> result;
    if (kind != ContextKind::FILE) {
        return result;
    }

    // "src/ma" lists "src/" for entries starting with "ma"
    size_t slash = prefix.rfind('/');
    std::string dir_part = slash == std::string::npos ? "" : prefix.substr(0, slash + 1);
    std::string name_part = slash == std::string::npos ? prefix : prefix.substr(slash + 1);

    fs::path base = expandHome(directory.empty() ? "." : directory);
    fs::path search = dir_part.empty() ? base
                                       : (dir_part[0] == '/' || dir_part[0] == '~'
                                              ? fs::path(expandHome(dir_part))
                                              : base / dir_part);

    std::error_code ec;
    fs::directory_iterator it(search, ec);
    if (ec) {
        log::debug("context", "cannot list " + search.string() + ": " + ec.message());
        return result;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!startsWith(name, name_part)) continue;
        // Hidden entries only when asked for explicitly
        if (!name.empty() && name[0] == '.' && (name_part.empty() || name_part[0] != '.')) continue;

        bool is_dir = entry.is_directory(ec);
        result.push_back({dir_part + name + (is_dir ? "/" : ""), is_dir ? "Directory" : "File"});
    }

    std::sort(result.begin(), result.end(),
              [](const ContextCandidate& a, const ContextCandidate& b) { return a.value < b.value; });
    if (result.size() > max_entries_) result.resize(max_entries_);

    return result;
}

} // namespace hint
