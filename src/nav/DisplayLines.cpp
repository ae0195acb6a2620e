#include "nav/DisplayLines.hpp"

#include <cctype>

#include "nav/PathCodec.hpp"

namespace {
int HexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

std::string Styled(const std::string& color, const std::string& text, const std::string& reset) {
    return color + SanitizeLabel(text) + reset;
}
}

std::string HexToAnsi(const std::string& hex) {
    std::string digits = hex;
    if (!digits.empty() && digits.front() == '#') {
        digits.erase(digits.begin());
    }
    if (digits.size() != 6) {
        return "";
    }

    int rgb[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        const int hi = HexValue(digits[static_cast<std::size_t>(i * 2)]);
        const int lo = HexValue(digits[static_cast<std::size_t>(i * 2 + 1)]);
        if (hi < 0 || lo < 0) {
            return "";
        }
        rgb[i] = hi * 16 + lo;
    }
    return "\033[38;2;" + std::to_string(rgb[0]) + ";" + std::to_string(rgb[1]) + ";" +
           std::to_string(rgb[2]) + "m";
}

Palette Palette::FromHex(const std::string& dir_hex, const std::string& file_hex) {
    Palette palette;
    palette.dir = HexToAnsi(dir_hex);
    palette.file = HexToAnsi(file_hex);
    if (!palette.dir.empty() || !palette.file.empty()) {
        palette.reset = "\033[0m";
    }
    return palette;
}

std::string SanitizeLabel(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') {
            c = '?';
        }
    }
    return out;
}

Frame BuildFrame(const std::string& current_dir,
                 const Listing& listing,
                 const NavigationMemory& memory,
                 const Palette& palette) {
    Frame frame;
    frame.lines.reserve(1 + listing.dirs.size() + listing.files.size());

    frame.lines.push_back(DisplayLine{EncodePath(ParentOf(current_dir)), Styled(palette.dir, "../", palette.reset)});

    std::string want_child;
    const auto remembered = memory.find(current_dir);
    if (remembered != memory.end()) {
        want_child = remembered->second;
    }

    for (const std::string& dir : listing.dirs) {
        std::string name = dir;
        if (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        const std::string path = NormalizePath(JoinPath(current_dir, name));
        if (!want_child.empty() && name == want_child) {
            frame.preselect = frame.lines.size();
        }
        frame.lines.push_back(DisplayLine{EncodePath(path), Styled(palette.dir, dir, palette.reset)});
    }

    for (const std::string& file : listing.files) {
        const std::string path = NormalizePath(JoinPath(current_dir, file));
        frame.lines.push_back(DisplayLine{EncodePath(path), Styled(palette.file, file, palette.reset)});
    }

    return frame;
}

DisplayLine MakeLine(const std::string& path, bool is_dir, const Palette& palette) {
    const std::string base = BaseName(path);
    if (is_dir) {
        return DisplayLine{EncodePath(path), Styled(palette.dir, base + "/", palette.reset)};
    }
    return DisplayLine{EncodePath(path), Styled(palette.file, base, palette.reset)};
}

std::string FormatLine(const DisplayLine& line) {
    return line.token + "\t" + line.label;
}

std::string FormatLines(const std::vector<DisplayLine>& lines) {
    std::string out;
    for (const DisplayLine& line : lines) {
        out += FormatLine(line);
        out += '\n';
    }
    return out;
}
