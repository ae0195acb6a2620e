#include "TestSupport.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "nav/PathCodec.hpp"
#include "search/WalkBackend.hpp"

TempDir::TempDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "fzdtest.XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = NormalizePath(std::filesystem::canonical(buffer.data()).string());
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string TempDir::MakeDir(const std::string& relative) const {
    const std::string path = path_ + "/" + relative;
    std::filesystem::create_directories(path);
    return NormalizePath(path);
}

std::string TempDir::MakeFile(const std::string& relative, const std::string& content) const {
    const std::string path = path_ + "/" + relative;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return NormalizePath(path);
}

std::string TempDir::MakeScript(const std::string& relative, const std::string& body) const {
    const std::string path = MakeFile(relative, "#!/bin/sh\n" + body);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                           std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
                                           std::filesystem::perms::others_exec);
    return path;
}

void ScriptedPicker::Push(ActionKind kind, const std::string& path) {
    script_.push_back(Action{kind, path.empty() ? std::string() : EncodePath(path)});
}

Action ScriptedPicker::RunFrame(const FrameRequest& request) {
    frames.push_back(request);
    if (script_.empty()) {
        return Action{ActionKind::Cancel, ""};
    }
    Action next = script_.front();
    script_.pop_front();
    return next;
}

FixedBackend::FixedBackend(std::vector<SearchResult> candidates, bool live)
    : candidates_(std::move(candidates)), live_(live) {}

std::vector<SearchResult> FixedBackend::Search(const std::string& query) {
    queries.push_back(query);
    std::vector<SearchResult> matches;
    for (const SearchResult& candidate : candidates_) {
        if (ContainsIgnoreCase(candidate.path, query)) {
            matches.push_back(candidate);
        }
    }
    return matches;
}
