#ifndef SEARCH_SEARCHBACKEND_HPP
#define SEARCH_SEARCHBACKEND_HPP

#include <string>
#include <vector>

struct SearchResult {
    std::string path;
    bool is_dir = false;

    bool operator==(const SearchResult& other) const {
        return path == other.path && is_dir == other.is_dir;
    }
};

// One way of finding paths across the filesystem.
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    // Live backends are re-queried on every keystroke; static ones are
    // queried once with an empty query and filtered by the picker.
    virtual bool IsLive() const = 0;

    virtual const char* Name() const = 0;

    // Existing directories and regular files whose path contains query
    // (case-insensitive). Unfiltered and uncapped.
    virtual std::vector<SearchResult> Search(const std::string& query) = 0;
};

#endif // SEARCH_SEARCHBACKEND_HPP
