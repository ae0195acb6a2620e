#ifndef SEARCH_SEARCHFILTER_HPP
#define SEARCH_SEARCHFILTER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "search/SearchBackend.hpp"

// Allowed-root and exclude-glob predicates over path strings.
class SearchFilter {
public:
    SearchFilter(std::vector<std::string> roots, std::vector<std::string> excludes);

    // True when path is a root or lies below one. No roots allows everything.
    bool UnderRoot(const std::string& path) const;

    // True when some run of consecutive path components matches an exclude glob.
    // "proc/*" excludes /proc/1, "var/lib/docker" excludes everything below it.
    bool Excluded(const std::string& path) const;

    bool Accepts(const std::string& path) const { return UnderRoot(path) && !Excluded(path); }

    // Keeps accepted results in order, drops duplicates, stops at max_results (0 = no cap).
    std::vector<SearchResult> Apply(const std::vector<SearchResult>& results, std::size_t max_results) const;

    const std::vector<std::string>& Roots() const { return roots_; }
    const std::vector<std::string>& Excludes() const { return excludes_; }

private:
    std::vector<std::string> roots_;
    std::vector<std::string> excludes_;
};

#endif // SEARCH_SEARCHFILTER_HPP
