#ifndef PICKER_ACTION_HPP
#define PICKER_ACTION_HPP

#include <string>

// How one picker invocation resolved. Into and Back only come from the overlay.
enum class ActionKind {
    Up,
    Down,
    Enter,
    Cancel,
    GlobalSearch,
    Into,
    Back
};

struct Action {
    ActionKind kind = ActionKind::Cancel;
    // Opaque path token of the highlighted line; empty when nothing was highlighted.
    std::string token;
};

// Side-channel tags written by the picker's key bindings.
ActionKind ActionKindFromTag(const std::string& tag, bool overlay);

const char* ActionKindName(ActionKind kind);

#endif // PICKER_ACTION_HPP
