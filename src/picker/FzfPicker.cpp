#include "picker/FzfPicker.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "log/Logger.hpp"
#include "process/Subprocess.hpp"

namespace {
std::string Binding(const std::string& key, const std::string& tag, const std::string& channel_path) {
    return "--bind=" + key + ":execute-silent(echo A:" + tag + ":{1} > " + ShellQuote(channel_path) + ")+abort";
}
}

FzfPicker::FzfPicker(std::string fzf_binary, const Settings& settings, std::string self_exe)
    : fzf_binary_(std::move(fzf_binary)), settings_(settings), self_exe_(std::move(self_exe)) {}

bool FzfPicker::SupportsStartPosition() {
    if (has_start_pos_.has_value()) {
        return *has_start_pos_;
    }

    ProcessOptions options;
    options.input = "x\n";
    options.feed_stdin = true;
    options.discard_stderr = true;
    try {
        const ProcessResult probe =
            RunProcess({fzf_binary_, "--bind=start:pos(1)", "--select-1", "--exit-0"}, options);
        has_start_pos_ = probe.exit_code == 0;
    } catch (const std::exception& e) {
        Log().Debug(std::string("start:pos probe failed: ") + e.what());
        has_start_pos_ = false;
    }
    Log().Debug(std::string("start:pos supported: ") + (*has_start_pos_ ? "yes" : "no"));
    return *has_start_pos_;
}

std::vector<std::string> FzfPicker::BuildCommand(const FrameRequest& request, const std::string& channel_path) {
    const bool overlay = request.mode == FrameRequest::Mode::Overlay;

    std::vector<std::string> argv{
        fzf_binary_,
        "--ansi",
        "--height=100%",
        "--layout=reverse",
        "--border",
        "--no-mouse",
        "+i",
        "--delimiter=\t",
        "--with-nth=2..",
        "--prompt=" + request.prompt,
        "--preview=" + ShellQuote(self_exe_) + " --_preview {1}",
        "--preview-window=right,60%:wrap",
        "--bind=esc:abort",
    };

    if (overlay) {
        if (!request.reload_command.empty()) {
            argv.push_back("--disabled");
            argv.push_back("--bind=change:reload:" + request.reload_command);
        }
        argv.push_back(Binding("enter", "G_ENTER", channel_path));
        argv.push_back(Binding("left", "G_LEFT", channel_path));
        argv.push_back(Binding("right", "G_RIGHT", channel_path));
        return argv;
    }

    argv.push_back("--print-query");
    if (!settings_.state_dir.empty()) {
        argv.push_back("--history=" + settings_.state_dir + "/query-history");
        argv.push_back("--history-size=4000");
    }
    argv.push_back(std::string("--expect=") + kGlobalSearchKey);
    if (request.preselect.has_value() && SupportsStartPosition()) {
        // fzf positions are 1-based.
        const std::string pos = "pos(" + std::to_string(*request.preselect + 1) + ")";
        argv.push_back("--bind=start:" + pos + ",load:" + pos);
    }
    argv.push_back(Binding("enter", "ENTER", channel_path));
    argv.push_back(Binding("left", "LEFT", channel_path));
    argv.push_back(Binding("right", "RIGHT", channel_path));
    return argv;
}

Action FzfPicker::Resolve(const std::string& fzf_output,
                          const std::optional<ActionChannel::Message>& message,
                          bool overlay) {
    if (!overlay) {
        // --print-query puts the query first, but the key line can come first
        // when the query is empty, so accept the trigger on either line.
        std::istringstream in(fzf_output);
        std::string line;
        for (int i = 0; i < 2 && std::getline(in, line); ++i) {
            if (line == kGlobalSearchKey) {
                return Action{ActionKind::GlobalSearch, ""};
            }
        }
    }

    if (!message.has_value()) {
        return Action{ActionKind::Cancel, ""};
    }
    const ActionKind kind = ActionKindFromTag(message->tag, overlay);
    if (kind == ActionKind::Cancel) {
        Log().Debug("unknown action tag '" + message->tag + "'");
        return Action{ActionKind::Cancel, ""};
    }
    return Action{kind, message->token};
}

Action FzfPicker::RunFrame(const FrameRequest& request) {
    const bool overlay = request.mode == FrameRequest::Mode::Overlay;
    ActionChannel channel(settings_.tmp_dir);

    ProcessOptions options;
    options.input = FormatLines(request.lines);
    options.feed_stdin = true;
    // FZF_DEFAULT_OPTS stays so the user's theme applies.
    options.unset_env = {"FZF_DEFAULT_COMMAND", "FZF_CTRL_T_COMMAND", "FZF_ALT_C_COMMAND"};

    const ProcessResult result = RunProcess(BuildCommand(request, channel.Path()), options);
    if (result.exit_code == 2 || result.exit_code == 127) {
        Log().Warn("fzf failed with status " + std::to_string(result.exit_code));
    }

    Action early = Resolve(result.output, std::nullopt, overlay);
    if (early.kind == ActionKind::GlobalSearch) {
        return early;
    }

    // The binding's write may land after fzf exits; wait a little, never forever.
    const std::optional<ActionChannel::Message> message = channel.Await(kChannelBudget, kChannelPoll);
    Action action = Resolve(result.output, message, overlay);
    Log().Debug(std::string("frame resolved: ") + ActionKindName(action.kind));
    return action;
}
