#include "search/LocateBackend.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

#include "log/Logger.hpp"
#include "nav/PathCodec.hpp"
#include "process/Subprocess.hpp"

namespace {
constexpr int kLocateTimeoutMs = 5000;
constexpr std::size_t kMaxLocateOutput = 16 * 1024 * 1024;
}

std::vector<SearchResult> ClassifyPaths(const std::string& text) {
    std::vector<SearchResult> results;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const std::string path = NormalizePath(line);
        std::error_code ec;
        const std::filesystem::file_status status = std::filesystem::status(path, ec);
        if (ec) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            results.push_back(SearchResult{path, true});
        } else if (std::filesystem::is_regular_file(status)) {
            results.push_back(SearchResult{path, false});
        }
    }
    return results;
}

LocateBackend::LocateBackend(std::string binary, std::string databases)
    : binary_(std::move(binary)), databases_(std::move(databases)) {}

std::string LocateBackend::Detect() {
    std::string found = FindExecutable("plocate");
    if (found.empty()) {
        found = FindExecutable("locate");
    }
    return found;
}

std::vector<std::string> LocateBackend::BuildCommand(const std::string& query) const {
    std::vector<std::string> argv{binary_};
    if (!databases_.empty()) {
        argv.push_back("-d");
        argv.push_back(databases_);
    }
    argv.push_back("-i");
    argv.push_back("-e");
    argv.push_back("--");
    argv.push_back(query);
    return argv;
}

std::vector<SearchResult> LocateBackend::Search(const std::string& query) {
    ProcessOptions options;
    options.discard_stderr = true;
    options.timeout_ms = kLocateTimeoutMs;
    options.max_output = kMaxLocateOutput;
    // LOCATE_PATH would silently add databases the user did not configure.
    options.unset_env.push_back("LOCATE_PATH");

    try {
        ProcessResult result = RunProcess(BuildCommand(query), options);
        if (result.timed_out) {
            Log().Debug("locate timed out for '" + query + "'");
        }
        if (result.truncated) {
            Log().Debug("locate output for '" + query + "' cut at " + std::to_string(kMaxLocateOutput) + " bytes");
        }
        if (result.timed_out || result.truncated) {
            // The last line may be a fragment of a longer path.
            const std::size_t last_newline = result.output.rfind('\n');
            result.output.resize(last_newline == std::string::npos ? 0 : last_newline + 1);
        }
        return ClassifyPaths(result.output);
    } catch (const std::exception& e) {
        Log().Debug(std::string("locate failed: ") + e.what());
        return {};
    }
}
