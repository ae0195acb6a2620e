#ifndef SEARCH_WALKBACKEND_HPP
#define SEARCH_WALKBACKEND_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "search/SearchBackend.hpp"
#include "search/SearchFilter.hpp"

// Brute-force walk of the allowed roots, built once into an in-memory index.
// Uses fd/fdfind when one is given, otherwise walks with std::filesystem.
class WalkBackend : public SearchBackend {
public:
    WalkBackend(SearchFilter filter, int max_depth, std::size_t max_entries, std::string fd_binary);

    bool IsLive() const override { return false; }
    const char* Name() const override { return fd_binary_.empty() ? "walk" : "fd"; }

    std::vector<SearchResult> Search(const std::string& query) override;

    // Builds on first use. Entries are filtered, de-duplicated and capped.
    const std::vector<SearchResult>& Index();

    // fd, else fdfind (Debian's name), else "".
    static std::string DetectFd();

    std::vector<std::string> BuildFdCommand() const;

private:
    std::vector<SearchResult> WalkWithFd() const;
    std::vector<SearchResult> WalkInProcess() const;

    SearchFilter filter_;
    int max_depth_;
    std::size_t max_entries_;
    std::string fd_binary_;
    std::optional<std::vector<SearchResult>> index_;
};

// ASCII case-insensitive substring test; an empty needle always matches.
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

#endif // SEARCH_WALKBACKEND_HPP
