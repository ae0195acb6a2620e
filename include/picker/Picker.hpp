#ifndef PICKER_PICKER_HPP
#define PICKER_PICKER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nav/DisplayLines.hpp"
#include "picker/Action.hpp"

// Everything one picker invocation needs to render a frame.
struct FrameRequest {
    enum class Mode {
        Browse,
        Overlay
    };

    Mode mode = Mode::Browse;
    std::string prompt;
    // Sent verbatim and in order; preselect indexes into this list.
    std::vector<DisplayLine> lines;
    std::optional<std::size_t> preselect;
    // Overlay only: shell command the picker re-runs with {q} on every query change.
    std::string reload_command;
};

// Interactive list-selection service. Blocks until the user resolves the frame.
class Picker {
public:
    virtual ~Picker() = default;

    virtual Action RunFrame(const FrameRequest& request) = 0;
};

#endif // PICKER_PICKER_HPP
