#ifndef PICKER_ACTIONCHANNEL_HPP
#define PICKER_ACTIONCHANNEL_HPP

#include <chrono>
#include <optional>
#include <string>

// One-shot rendezvous between a picker key binding and the driver.
// Backed by a fresh temp file that is removed when the channel goes away.
class ActionChannel {
public:
    struct Message {
        std::string tag;
        std::string token;
    };

    // Creates the backing file in dir. Throws std::runtime_error on failure.
    explicit ActionChannel(const std::string& dir);
    ~ActionChannel();

    ActionChannel(const ActionChannel&) = delete;
    ActionChannel& operator=(const ActionChannel&) = delete;

    const std::string& Path() const { return path_; }

    // Polls until a message line shows up or the budget runs out.
    std::optional<Message> Await(std::chrono::milliseconds budget, std::chrono::milliseconds interval);

    // Parses "A:TAG:TOKEN". Other lines yield nothing.
    static std::optional<Message> Parse(const std::string& line);

private:
    std::optional<Message> ReadOnce() const;

    std::string path_;
};

#endif // PICKER_ACTIONCHANNEL_HPP
