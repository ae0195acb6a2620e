#include "tui/NoticeScreen.hpp"

#include <cstdio>
#include <ctime>
#include <exception>
#include <memory>
#include <utility>
#include <notcurses/notcurses.h>

#include "log/Logger.hpp"
#include "tui/Signal.hpp"

NoticeScreen::NoticeScreen(std::string title, std::vector<std::string> lines)
    : title_(std::move(title)), lines_(std::move(lines)) {}

void NoticeScreen::Draw(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    stdplane.erase();
    stdplane.perimeter_rounded(0, 0, 0);

    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);
    (void)cols;

    if (!title_.empty()) {
        stdplane.putstr(0, 2, (" " + title_ + " ").c_str());
    }

    const int total_lines = static_cast<int>(lines_.size());
    const int mid_row = static_cast<int>(rows) / 2;
    for (int index = 0; index < total_lines; ++index) {
        const int row = mid_row - total_lines / 2 + index;
        stdplane.putstr(row, ncpp::NCAlign::Center, lines_[static_cast<std::size_t>(index)].c_str());
    }
    nc.render();
}

bool NoticeScreen::HandleInput(uint32_t input, const ncinput& details) const {
    if (input == NCKEY_ESC) {
        return true;
    }
    // Raw mode delivers Ctrl-C as a key rather than SIGINT.
    return (input == 'c' || input == 'C') && ncinput_ctrl_p(&details);
}

bool NoticeScreen::Show() {
    FILE* tty = std::fopen("/dev/tty", "r+");
    if (tty == nullptr) {
        Log().Warn("no terminal for notice: " + title_);
        return false;
    }

    try {
        notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
        nc_options.flags |= NCOPTION_SUPPRESS_BANNERS;
        ncpp::NotCurses nc(nc_options, tty);
        std::unique_ptr<ncpp::Plane> stdplane{nc.get_stdplane()};

        const timespec poll_timeout{0, 100'000'000}; // 100ms
        Draw(nc, *stdplane);

        while (true) {
            ncinput input_details{};
            const uint32_t ch = notcurses_get(nc, &poll_timeout, &input_details);

            if (g_sigint_received.load(std::memory_order_relaxed)) {
                break;
            }
            if (ch == 0) {
                continue;
            }
            if (static_cast<int32_t>(ch) == -1) {
                // Input error; leave so the destructor restores the terminal.
                break;
            }
            if (input_details.evtype == NCTYPE_RELEASE) {
                continue;
            }
            if (ch == NCKEY_RESIZE) {
                Draw(nc, *stdplane);
                continue;
            }
            if (HandleInput(ch, input_details)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        Log().Warn(std::string("notice screen failed: ") + e.what());
        std::fclose(tty);
        return false;
    }

    std::fclose(tty);
    return true;
}
