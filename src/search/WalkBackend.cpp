#include "search/WalkBackend.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

#include "log/Logger.hpp"
#include "nav/PathCodec.hpp"
#include "process/Subprocess.hpp"
#include "search/LocateBackend.hpp"

namespace {
constexpr int kIndexTimeoutMs = 60000;

char Lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return Lower(a) == Lower(b); });
    return it != haystack.end();
}

WalkBackend::WalkBackend(SearchFilter filter, int max_depth, std::size_t max_entries, std::string fd_binary)
    : filter_(std::move(filter)),
      max_depth_(max_depth),
      max_entries_(max_entries),
      fd_binary_(std::move(fd_binary)) {}

std::string WalkBackend::DetectFd() {
    std::string found = FindExecutable("fd");
    if (found.empty()) {
        found = FindExecutable("fdfind");
    }
    return found;
}

std::vector<std::string> WalkBackend::BuildFdCommand() const {
    // Hidden, case-insensitive, absolute, depth-bounded, no .gitignore filtering, no symlink follow.
    std::vector<std::string> argv{fd_binary_, "-H", "-I", "-i", "--color=never", "-a", "-d", std::to_string(max_depth_)};
    for (const std::string& pattern : filter_.Excludes()) {
        argv.push_back("--exclude");
        argv.push_back(pattern);
    }
    argv.push_back(".");
    for (const std::string& root : filter_.Roots()) {
        argv.push_back(root);
    }
    return argv;
}

std::vector<SearchResult> WalkBackend::WalkWithFd() const {
    ProcessOptions options;
    options.discard_stderr = true;
    options.timeout_ms = kIndexTimeoutMs;

    try {
        const ProcessResult result = RunProcess(BuildFdCommand(), options);
        if (result.timed_out) {
            Log().Warn("fd index timed out; showing a partial index");
        }
        return ClassifyPaths(result.output);
    } catch (const std::exception& e) {
        Log().Warn(std::string("fd failed, walking in-process: ") + e.what());
        return WalkInProcess();
    }
}

std::vector<SearchResult> WalkBackend::WalkInProcess() const {
    std::vector<SearchResult> found;
    const std::filesystem::directory_options walk_options = std::filesystem::directory_options::skip_permission_denied;

    for (const std::string& root : filter_.Roots()) {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(root, walk_options, ec);
        if (ec) {
            Log().Debug("walk " + root + ": " + ec.message());
            continue;
        }

        for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                Log().Debug("walk " + root + " stopped: " + ec.message());
                break;
            }
            if (max_entries_ > 0 && found.size() >= max_entries_) {
                return found;
            }

            const std::filesystem::directory_entry& entry = *it;
            const std::string path = entry.path().string();
            // depth() is 0 for direct children, which fd counts as depth 1.
            const int depth = it.depth() + 1;

            if (filter_.Excluded(path)) {
                it.disable_recursion_pending();
                continue;
            }
            if (depth >= max_depth_) {
                it.disable_recursion_pending();
            }

            std::error_code kind_ec;
            if (entry.is_directory(kind_ec)) {
                found.push_back(SearchResult{path, true});
            } else if (entry.is_regular_file(kind_ec)) {
                found.push_back(SearchResult{path, false});
            }
        }
    }
    return found;
}

const std::vector<SearchResult>& WalkBackend::Index() {
    if (!index_.has_value()) {
        std::vector<SearchResult> raw = fd_binary_.empty() ? WalkInProcess() : WalkWithFd();
        index_ = filter_.Apply(raw, max_entries_);
        Log().Debug(std::string("index built by ") + Name() + ": " + std::to_string(index_->size()) + " entries");
    }
    return *index_;
}

std::vector<SearchResult> WalkBackend::Search(const std::string& query) {
    std::vector<SearchResult> matches;
    for (const SearchResult& result : Index()) {
        if (ContainsIgnoreCase(result.path, query)) {
            matches.push_back(result);
        }
    }
    return matches;
}
