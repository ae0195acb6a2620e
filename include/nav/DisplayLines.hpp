#ifndef NAV_DISPLAYLINES_HPP
#define NAV_DISPLAYLINES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nav/EntryLister.hpp"

// Parent directory -> basename of the child last entered from it.
using NavigationMemory = std::unordered_map<std::string, std::string>;

// ANSI sequences wrapped around labels. All empty means terminal defaults.
struct Palette {
    std::string dir;
    std::string file;
    std::string reset;

    // Accepts "#RRGGBB" (or "RRGGBB"); anything else leaves that color unset.
    static Palette FromHex(const std::string& dir_hex, const std::string& file_hex);
};

// Truecolor foreground escape for "#RRGGBB", or "" when the value is malformed.
std::string HexToAnsi(const std::string& hex);

struct DisplayLine {
    std::string token;
    std::string label;
};

struct Frame {
    std::vector<DisplayLine> lines;
    // Index into lines of the remembered child directory.
    std::optional<std::size_t> preselect;
};

// Line 0 is "../", then directories, then files, in listing order.
Frame BuildFrame(const std::string& current_dir,
                 const Listing& listing,
                 const NavigationMemory& memory,
                 const Palette& palette);

// One display line for an arbitrary path, as used by the global search lists.
DisplayLine MakeLine(const std::string& path, bool is_dir, const Palette& palette);

// "token<TAB>label", the record format read by the picker.
std::string FormatLine(const DisplayLine& line);

// Joins records with '\n', including a trailing newline.
std::string FormatLines(const std::vector<DisplayLine>& lines);

// Replaces TAB, LF and CR so a name cannot break the record format.
std::string SanitizeLabel(const std::string& name);

#endif // NAV_DISPLAYLINES_HPP
