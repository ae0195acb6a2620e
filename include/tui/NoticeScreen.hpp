#ifndef TUI_NOTICESCREEN_HPP
#define TUI_NOTICESCREEN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

// Full-screen framed message that only answers to Escape (or Ctrl-C).
// Drawn on /dev/tty so stdout stays free for the chosen directory.
class NoticeScreen {
public:
    NoticeScreen(std::string title, std::vector<std::string> lines);

    // Blocks until dismissed. Returns false if the terminal could not be opened.
    bool Show();

private:
    void Draw(ncpp::NotCurses& nc, ncpp::Plane& stdplane);
    // True once the screen should close.
    bool HandleInput(uint32_t input, const ncinput& details) const;

    std::string title_;
    std::vector<std::string> lines_;
};

#endif // TUI_NOTICESCREEN_HPP
