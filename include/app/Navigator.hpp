#ifndef APP_NAVIGATOR_HPP
#define APP_NAVIGATOR_HPP

#include <string>

#include "config/Settings.hpp"
#include "nav/NavigationState.hpp"
#include "picker/Picker.hpp"

class Editor;
class GlobalSearch;

// Exit status reported when the user backs out with Escape.
constexpr int kExitCancelled = 130;

struct SessionResult {
    bool confirmed = false;
    std::string path;
};

inline int ExitCodeFor(const SessionResult& result) {
    return result.confirmed ? 0 : kExitCancelled;
}

// The per-directory browse loop: list, render one picker frame, apply the action.
class Navigator {
public:
    Navigator(NavigationState& state, Picker& picker, Editor& editor, GlobalSearch& search, const Settings& settings);

    // Runs until a directory is confirmed or the user cancels.
    SessionResult Run();

    // Frame for the current directory: lines, preselection and prompt.
    FrameRequest NextFrame() const;

private:
    NavigationState& state_;
    Picker& picker_;
    Editor& editor_;
    GlobalSearch& search_;
    const Settings& settings_;
};

// "~/src/ > " style prompt; home is abbreviated when given.
std::string PromptFor(const std::string& dir, const std::string& home);

#endif // APP_NAVIGATOR_HPP
