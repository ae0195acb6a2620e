#ifndef SEARCH_LOCATEBACKEND_HPP
#define SEARCH_LOCATEBACKEND_HPP

#include <string>
#include <vector>

#include "search/SearchBackend.hpp"

// Indexed search through plocate/locate. Queried live on every keystroke.
// locate itself is never limited by a count: its matches still have to pass
// the root and exclude filters, so only the raw output size is bounded.
class LocateBackend : public SearchBackend {
public:
    LocateBackend(std::string binary, std::string databases);

    bool IsLive() const override { return true; }
    const char* Name() const override { return "locate"; }

    std::vector<SearchResult> Search(const std::string& query) override;

    // plocate, else locate, else "".
    static std::string Detect();

    std::vector<std::string> BuildCommand(const std::string& query) const;

private:
    std::string binary_;
    std::string databases_;
};

// Turns newline-separated paths into results, keeping only existing directories and files.
std::vector<SearchResult> ClassifyPaths(const std::string& text);

#endif // SEARCH_LOCATEBACKEND_HPP
