#ifndef PICKER_FZFPICKER_HPP
#define PICKER_FZFPICKER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "config/Settings.hpp"
#include "picker/ActionChannel.hpp"
#include "picker/Picker.hpp"

// Drives one fzf process per frame.
//
// fzf reports the --expect key and the --print-query text through the same
// stdout, and Enter/Left/Right all end in a plain abort. Each of those keys
// therefore writes "A:TAG:{1}" to a per-frame ActionChannel before aborting;
// the driver polls that file briefly after fzf exits and treats silence as Cancel.
class FzfPicker : public Picker {
public:
    static constexpr const char* kGlobalSearchKey = "ctrl-f";

    FzfPicker(std::string fzf_binary, const Settings& settings, std::string self_exe);

    Action RunFrame(const FrameRequest& request) override;

    // Full argv for one frame; the channel path is baked into the key bindings.
    std::vector<std::string> BuildCommand(const FrameRequest& request, const std::string& channel_path);

    // Folds fzf's stdout and the side-channel message into one action.
    static Action Resolve(const std::string& fzf_output,
                          const std::optional<ActionChannel::Message>& message,
                          bool overlay);

    // Whether this fzf understands start:pos(N). Probed once.
    bool SupportsStartPosition();

    // Test hook: skip the probe.
    void SetStartPositionSupport(bool supported) { has_start_pos_ = supported; }

private:
    std::string fzf_binary_;
    const Settings& settings_;
    std::string self_exe_;
    std::optional<bool> has_start_pos_;

    static constexpr std::chrono::milliseconds kChannelBudget{200};
    static constexpr std::chrono::milliseconds kChannelPoll{10};
};

#endif // PICKER_FZFPICKER_HPP
