#include "app/Editor.hpp"

#include <filesystem>
#include <system_error>

#include "config/Settings.hpp"
#include "log/Logger.hpp"
#include "process/Subprocess.hpp"

ExternalEditor::ExternalEditor(const std::string& command)
    : command_(SplitList(command, ' ')) {
    if (command_.empty() || FindExecutable(command_.front()).empty()) {
        Log().Debug("editor '" + command + "' not found, using micro");
        command_ = {"micro"};
    }
}

std::vector<std::string> ExternalEditor::BuildCommand(const std::string& path) const {
    std::vector<std::string> argv = command_;
    argv.push_back("--");
    argv.push_back(path);
    return argv;
}

void ExternalEditor::Open(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return;
    }

    try {
        const int status = RunOnTerminal(BuildCommand(path));
        if (status != 0) {
            Log().Debug(command_.front() + " exited with status " + std::to_string(status));
        }
    } catch (const std::exception& e) {
        Log().Warn(std::string("cannot start editor: ") + e.what());
    }
}
