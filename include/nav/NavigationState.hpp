#ifndef NAV_NAVIGATIONSTATE_HPP
#define NAV_NAVIGATIONSTATE_HPP

#include <string>

#include "nav/DisplayLines.hpp"

// Current directory plus the per-parent memory of the last child entered.
class NavigationState {
public:
    enum class EnterResult {
        ConfirmDirectory,
        OpenFile,
        Ignored
    };

    explicit NavigationState(const std::string& start_dir);

    // Ascends to the parent, remembering where we came from. At "/" this re-enters "/".
    void Up();

    // Descends into a directory. Returns false (no change) for non-directories and the ".." target.
    bool Down(const std::string& path);

    // Classifies an Enter on path. ConfirmDirectory sets ConfirmedPath().
    EnterResult Enter(const std::string& path);

    // Marks path as the session's answer without the ".." rule (global search).
    void Confirm(const std::string& path);

    // Moves next to a file picked from the global search, preselecting its directory on the way up.
    void ArriveAtFile(const std::string& file_path);

    const std::string& CurrentDir() const { return current_dir_; }
    const std::string& ConfirmedPath() const { return confirmed_; }
    const NavigationMemory& Memory() const { return memory_; }

private:
    void Remember(const std::string& parent, const std::string& child);

    std::string current_dir_;
    std::string confirmed_;
    NavigationMemory memory_;
};

// Normalized start directory: the logical $PWD when it names the cwd, else getcwd().
std::string StartingDirectory();

#endif // NAV_NAVIGATIONSTATE_HPP
