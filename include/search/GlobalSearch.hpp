#ifndef SEARCH_GLOBALSEARCH_HPP
#define SEARCH_GLOBALSEARCH_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config/Settings.hpp"
#include "nav/DisplayLines.hpp"
#include "search/SearchBackend.hpp"
#include "search/SearchFilter.hpp"

class Editor;
class NavigationState;
class Picker;

enum class BackendKind {
    Indexed,
    Walk,
    None
};

// Pure choice of backend from the configured preference and what is installed.
BackendKind SelectBackendKind(BackendChoice choice, bool locate_available);

// Roots from the settings, excludes from both exclude lists.
SearchFilter MakeSearchFilter(const Settings& settings);

// Upper bound on the walk index. The display cap (max_results) is applied
// later, to the filtered matches of each query.
constexpr std::size_t kWalkIndexLimit = 500000;

// Backend for the current machine, or nullptr when global search is disabled.
std::unique_ptr<SearchBackend> MakeBackend(const Settings& settings);

// The backend of one kind; locate_binary is only used for Indexed.
std::unique_ptr<SearchBackend> MakeBackendOfKind(BackendKind kind, const Settings& settings,
                                                 const std::string& locate_binary);

// Min-length gate, root/exclude filtering and the result cap around one backend query.
std::vector<SearchResult> RunQuery(SearchBackend& backend, const Settings& settings, const std::string& query);

// Every candidate of a static backend, filtered and capped. No length gate.
std::vector<SearchResult> RunCandidates(SearchBackend& backend, const Settings& settings);

std::vector<DisplayLine> ResultLines(const std::vector<SearchResult>& results, const Palette& palette);

// The Ctrl-F overlay: one picker session over a search backend, resolved
// against the navigation state.
class GlobalSearch {
public:
    enum class Outcome {
        Resume,
        Confirmed
    };

    using BackendFactory = std::function<std::unique_ptr<SearchBackend>()>;

    GlobalSearch(const Settings& settings, Picker& picker, Editor& editor, std::string self_exe);

    // Replaces backend discovery; returning nullptr means "unavailable".
    void SetBackendFactory(BackendFactory factory) { factory_ = std::move(factory); }

    // Shown instead of a picker when no backend is usable.
    void SetUnavailableNotice(std::function<void()> notice) { notice_ = std::move(notice); }

    // Confirmed leaves the chosen directory in state.ConfirmedPath().
    Outcome Run(NavigationState& state);

    std::string Prompt() const;

private:
    const Settings& settings_;
    Picker& picker_;
    Editor& editor_;
    std::string self_exe_;
    BackendFactory factory_;
    std::function<void()> notice_;
};

#endif // SEARCH_GLOBALSEARCH_HPP
