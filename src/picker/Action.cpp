#include "picker/Action.hpp"

ActionKind ActionKindFromTag(const std::string& tag, bool overlay) {
    if (overlay) {
        if (tag == "G_ENTER") {
            return ActionKind::Enter;
        }
        if (tag == "G_RIGHT") {
            return ActionKind::Into;
        }
        if (tag == "G_LEFT") {
            return ActionKind::Back;
        }
        return ActionKind::Cancel;
    }

    if (tag == "ENTER") {
        return ActionKind::Enter;
    }
    if (tag == "LEFT") {
        return ActionKind::Up;
    }
    if (tag == "RIGHT") {
        return ActionKind::Down;
    }
    if (tag == "GLOBAL") {
        return ActionKind::GlobalSearch;
    }
    return ActionKind::Cancel;
}

const char* ActionKindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::Up:
            return "up";
        case ActionKind::Down:
            return "down";
        case ActionKind::Enter:
            return "enter";
        case ActionKind::Cancel:
            return "cancel";
        case ActionKind::GlobalSearch:
            return "global-search";
        case ActionKind::Into:
            return "into";
        case ActionKind::Back:
            return "back";
    }
    return "unknown";
}
