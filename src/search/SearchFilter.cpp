#include "search/SearchFilter.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <unordered_set>
#include <utility>

#include "nav/PathCodec.hpp"

namespace {
std::vector<std::string> Components(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string CleanPattern(const std::string& pattern) {
    std::string out = pattern;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    while (!out.empty() && out.front() == '/') {
        out.erase(out.begin());
    }
    return out;
}
}

SearchFilter::SearchFilter(std::vector<std::string> roots, std::vector<std::string> excludes)
    : roots_(std::move(roots)) {
    for (std::string& root : roots_) {
        root = NormalizePath(root);
    }
    for (const std::string& pattern : excludes) {
        const std::string cleaned = CleanPattern(pattern);
        if (!cleaned.empty()) {
            excludes_.push_back(cleaned);
        }
    }
}

bool SearchFilter::UnderRoot(const std::string& path) const {
    if (roots_.empty()) {
        return true;
    }
    for (const std::string& root : roots_) {
        if (root == "/" || path == root) {
            return true;
        }
        if (path.size() > root.size() && path.compare(0, root.size(), root) == 0 && path[root.size()] == '/') {
            return true;
        }
    }
    return false;
}

bool SearchFilter::Excluded(const std::string& path) const {
    if (excludes_.empty()) {
        return false;
    }
    const std::vector<std::string> parts = Components(path);

    for (const std::string& pattern : excludes_) {
        // fnmatch with FNM_PATHNAME never lets a wildcard cross '/', so only
        // runs with as many components as the pattern can match.
        const std::size_t width = static_cast<std::size_t>(std::count(pattern.begin(), pattern.end(), '/')) + 1;
        if (width > parts.size()) {
            continue;
        }
        for (std::size_t start = 0; start + width <= parts.size(); ++start) {
            std::string run = parts[start];
            for (std::size_t i = 1; i < width; ++i) {
                run += "/";
                run += parts[start + i];
            }
            if (fnmatch(pattern.c_str(), run.c_str(), FNM_PATHNAME | FNM_CASEFOLD) == 0) {
                return true;
            }
        }
    }
    return false;
}

std::vector<SearchResult> SearchFilter::Apply(const std::vector<SearchResult>& results, std::size_t max_results) const {
    std::vector<SearchResult> kept;
    std::unordered_set<std::string> seen;
    for (const SearchResult& result : results) {
        if (max_results > 0 && kept.size() >= max_results) {
            break;
        }
        const std::string path = NormalizePath(result.path);
        if (!Accepts(path) || !seen.insert(path).second) {
            continue;
        }
        kept.push_back(SearchResult{path, result.is_dir});
    }
    return kept;
}
