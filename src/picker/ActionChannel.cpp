#include "picker/ActionChannel.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <vector>

#include "log/Logger.hpp"

ActionChannel::ActionChannel(const std::string& dir) {
    std::string pattern = (dir.empty() ? std::string("/tmp") : dir) + "/fzd-action.XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = mkstemp(buffer.data());
    if (fd < 0) {
        throw std::runtime_error("cannot create action channel in " + dir + ": " + std::strerror(errno));
    }
    close(fd);
    path_ = buffer.data();
}

ActionChannel::~ActionChannel() {
    if (!path_.empty() && unlink(path_.c_str()) != 0 && errno != ENOENT) {
        Log().Debug("cannot remove " + path_ + ": " + std::strerror(errno));
    }
}

std::optional<ActionChannel::Message> ActionChannel::Parse(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (text.rfind("A:", 0) != 0) {
        return std::nullopt;
    }
    const std::size_t colon = text.find(':', 2);
    if (colon == std::string::npos || colon == 2) {
        return std::nullopt;
    }
    return Message{text.substr(2, colon - 2), text.substr(colon + 1)};
}

std::optional<ActionChannel::Message> ActionChannel::ReadOnce() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line)) {
        std::optional<Message> message = Parse(line);
        if (message.has_value()) {
            return message;
        }
    }
    return std::nullopt;
}

std::optional<ActionChannel::Message> ActionChannel::Await(std::chrono::milliseconds budget,
                                                           std::chrono::milliseconds interval) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    while (true) {
        std::optional<Message> message = ReadOnce();
        if (message.has_value()) {
            return message;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(interval);
    }
}
