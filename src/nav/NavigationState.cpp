#include "nav/NavigationState.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "log/Logger.hpp"
#include "nav/PathCodec.hpp"

namespace {
bool IsDirectory(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool IsRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}
}

NavigationState::NavigationState(const std::string& start_dir)
    : current_dir_(NormalizePath(start_dir)) {}

void NavigationState::Remember(const std::string& parent, const std::string& child) {
    if (parent.empty() || child.empty()) {
        return;
    }
    memory_[parent] = child;
    Log().Debug("remember [" + parent + "] = '" + child + "'");
}

void NavigationState::Up() {
    const std::string parent = ParentOf(current_dir_);
    Remember(parent, BaseName(current_dir_));
    current_dir_ = parent;
    Log().Debug("up -> " + current_dir_);
}

bool NavigationState::Down(const std::string& path) {
    const std::string target = NormalizePath(path);
    if (target.empty() || !IsDirectory(target) || target == ParentOf(current_dir_)) {
        Log().Debug("down ignored ('" + target + "')");
        return false;
    }
    Remember(current_dir_, BaseName(target));
    current_dir_ = target;
    Log().Debug("down -> " + current_dir_);
    return true;
}

NavigationState::EnterResult NavigationState::Enter(const std::string& path) {
    const std::string target = NormalizePath(path);
    if (target.empty()) {
        return EnterResult::Ignored;
    }
    if (IsDirectory(target)) {
        // Enter on the ".." line confirms where we are instead of ascending.
        confirmed_ = target == ParentOf(current_dir_) ? current_dir_ : target;
        return EnterResult::ConfirmDirectory;
    }
    if (IsRegularFile(target)) {
        return EnterResult::OpenFile;
    }
    return EnterResult::Ignored;
}

void NavigationState::Confirm(const std::string& path) {
    confirmed_ = NormalizePath(path);
}

void NavigationState::ArriveAtFile(const std::string& file_path) {
    current_dir_ = ParentOf(NormalizePath(file_path));
    Remember(ParentOf(current_dir_), BaseName(current_dir_));
    Log().Debug("jump -> " + current_dir_);
}

std::string StartingDirectory() {
    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        Log().Warn("cannot determine working directory: " + ec.message());
        return "/";
    }

    const char* pwd = std::getenv("PWD");
    if (pwd != nullptr && pwd[0] == '/') {
        std::error_code same_ec;
        if (std::filesystem::equivalent(pwd, cwd, same_ec)) {
            return NormalizePath(pwd);
        }
    }
    return NormalizePath(cwd.string());
}
