#include "app/Navigator.hpp"

#include <cstdlib>
#include <optional>
#include <utility>

#include "app/Editor.hpp"
#include "log/Logger.hpp"
#include "nav/EntryLister.hpp"
#include "nav/PathCodec.hpp"
#include "search/GlobalSearch.hpp"
#include "tui/Signal.hpp"

std::string PromptFor(const std::string& dir, const std::string& home) {
    if (dir == "/") {
        return "/ > ";
    }
    std::string shown = dir;
    if (!home.empty() && home != "/") {
        if (dir == home) {
            shown = "~";
        } else if (dir.size() > home.size() && dir.compare(0, home.size(), home) == 0 && dir[home.size()] == '/') {
            shown = "~" + dir.substr(home.size());
        }
    }
    return shown + "/ > ";
}

Navigator::Navigator(NavigationState& state, Picker& picker, Editor& editor, GlobalSearch& search, const Settings& settings)
    : state_(state), picker_(picker), editor_(editor), search_(search), settings_(settings) {}

FrameRequest Navigator::NextFrame() const {
    const Listing listing = ListDirectory(state_.CurrentDir());
    Frame frame = BuildFrame(state_.CurrentDir(), listing, state_.Memory(), settings_.palette);

    FrameRequest request;
    request.mode = FrameRequest::Mode::Browse;
    const char* home = std::getenv("HOME");
    request.prompt = PromptFor(state_.CurrentDir(), home != nullptr ? NormalizePath(home) : "");
    request.lines = std::move(frame.lines);
    request.preselect = frame.preselect;
    return request;
}

SessionResult Navigator::Run() {
    while (true) {
        g_sigint_received.store(false, std::memory_order_relaxed);

        const FrameRequest request = NextFrame();
        const Action action = picker_.RunFrame(request);
        if (g_sigint_received.load(std::memory_order_relaxed)) {
            Log().Debug("interrupted");
            return SessionResult{};
        }

        std::string path;
        if (!action.token.empty()) {
            const std::optional<std::string> decoded = DecodePath(action.token);
            if (decoded.has_value()) {
                path = NormalizePath(*decoded);
            } else {
                Log().Debug("undecodable token '" + action.token + "'");
            }
        }

        switch (action.kind) {
            case ActionKind::Cancel:
                Log().Debug("cancelled");
                return SessionResult{};
            case ActionKind::GlobalSearch:
                if (search_.Run(state_) == GlobalSearch::Outcome::Confirmed) {
                    return SessionResult{true, state_.ConfirmedPath()};
                }
                break;
            case ActionKind::Up:
                state_.Up();
                break;
            case ActionKind::Down:
                state_.Down(path);
                break;
            case ActionKind::Enter:
                switch (state_.Enter(path)) {
                    case NavigationState::EnterResult::ConfirmDirectory:
                        Log().Debug("confirmed " + state_.ConfirmedPath());
                        return SessionResult{true, state_.ConfirmedPath()};
                    case NavigationState::EnterResult::OpenFile:
                        editor_.Open(path);
                        break;
                    case NavigationState::EnterResult::Ignored:
                        break;
                }
                break;
            case ActionKind::Into:
            case ActionKind::Back:
                break;
        }
    }
}
