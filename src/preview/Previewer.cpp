#include "preview/Previewer.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "log/Logger.hpp"
#include "media/MediaProbe.hpp"
#include "nav/EntryLister.hpp"
#include "nav/PathCodec.hpp"
#include "process/Subprocess.hpp"

namespace {
constexpr std::size_t kMaxToolOutput = 512 * 1024;
constexpr std::size_t kSniffBytes = 4096;
constexpr std::size_t kDumpBytes = 1024;

constexpr const char* kTreeBranch = "├── ";
constexpr const char* kTreeLast = "└── ";
constexpr const char* kTreePipe = "│   ";
constexpr const char* kTreeSpace = "    ";
constexpr const char* kDirColor = "\033[1;34m";
constexpr const char* kReset = "\033[0m";
constexpr const char* kTimedOut = "(preview timed out)";

std::string Trim(const std::string& s) {
    std::size_t end = s.size();
    while (end > 0 && (s[end - 1] == '\n' || s[end - 1] == '\r' || s[end - 1] == ' ')) {
        --end;
    }
    return s.substr(0, end);
}

std::string ReadHead(const std::string& file, std::size_t bytes) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return "";
    }
    std::string data(bytes, '\0');
    in.read(&data[0], static_cast<std::streamsize>(bytes));
    data.resize(static_cast<std::size_t>(in.gcount()));
    return data;
}

std::string PermissionString(const std::filesystem::file_status& status) {
    using std::filesystem::perms;
    const perms p = status.permissions();
    std::string out = std::filesystem::is_directory(status) ? "d" : "-";
    const perms bits[] = {perms::owner_read, perms::owner_write, perms::owner_exec,
                          perms::group_read, perms::group_write, perms::group_exec,
                          perms::others_read, perms::others_write, perms::others_exec};
    const char letters[] = {'r', 'w', 'x'};
    for (std::size_t i = 0; i < 9; ++i) {
        out.push_back((p & bits[i]) != perms::none ? letters[i % 3] : '-');
    }
    return out;
}

struct TreeWalk {
    const std::vector<std::string>& excludes;
    int max_depth;
    int max_lines;
    std::chrono::steady_clock::time_point deadline;
    std::ostream& out;
    int lines = 0;
    int dirs = 0;
    int files = 0;
    bool stopped = false;

    bool Ignored(const std::string& name) const {
        for (const std::string& pattern : excludes) {
            if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
                return true;
            }
        }
        return false;
    }

    void Walk(const std::string& dir, const std::string& prefix, int depth) {
        Listing listing = ListDirectory(dir);
        std::vector<std::pair<std::string, bool>> entries;
        for (const std::string& name : listing.dirs) {
            entries.emplace_back(name.substr(0, name.size() - 1), true);
        }
        for (const std::string& name : listing.files) {
            entries.emplace_back(name, false);
        }
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [this](const std::pair<std::string, bool>& e) { return Ignored(e.first); }),
                      entries.end());

        for (std::size_t i = 0; i < entries.size() && !stopped; ++i) {
            if (lines >= max_lines) {
                out << prefix << "…\n";
                stopped = true;
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                out << kTimedOut << "\n";
                stopped = true;
                return;
            }

            const bool last = i + 1 == entries.size();
            const std::string& name = entries[i].first;
            out << prefix << (last ? kTreeLast : kTreeBranch);
            if (entries[i].second) {
                out << kDirColor << name << kReset << "\n";
                ++dirs;
            } else {
                out << name << "\n";
                ++files;
            }
            ++lines;

            if (entries[i].second && depth < max_depth) {
                Walk(JoinPath(dir, name), prefix + (last ? kTreeSpace : kTreePipe), depth + 1);
            }
        }
    }
};
}

Previewer::Previewer(const Settings& settings)
    : settings_(settings), started_(std::chrono::steady_clock::now()) {}

std::chrono::steady_clock::time_point Previewer::Deadline() const {
    if (settings_.preview_timeout_seconds <= 0) {
        return std::chrono::steady_clock::time_point::max();
    }
    return started_ + std::chrono::seconds(settings_.preview_timeout_seconds);
}

bool Previewer::RunTool(const std::vector<std::string>& argv, std::ostream& out) {
    if (FindExecutable(argv.front()).empty()) {
        return false;
    }

    ProcessOptions options;
    options.discard_stderr = true;
    options.max_output = kMaxToolOutput;
    if (settings_.preview_timeout_seconds > 0) {
        // Every tool of one preview shares the same deadline.
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(Deadline() - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            out << kTimedOut << "\n";
            return true;
        }
        options.timeout_ms = static_cast<int>(std::max<long long>(1, remaining.count()));
    }

    try {
        const ProcessResult result = RunProcess(argv, options);
        out << result.output;
        if (result.timed_out) {
            if (!result.output.empty() && result.output.back() != '\n') {
                out << "\n";
            }
            out << kTimedOut << "\n";
        }
    } catch (const std::exception& e) {
        Log().Debug(argv.front() + " failed: " + e.what());
        return false;
    }
    return true;
}

void Previewer::Render(const std::string& token, std::ostream& out) {
    const std::optional<std::string> decoded = DecodePath(token);
    if (!decoded.has_value()) {
        return;
    }
    const std::string path = NormalizePath(*decoded);

    std::error_code ec;
    const std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::is_directory(status)) {
        RenderDirectory(path, out);
    } else if (!ec && std::filesystem::is_regular_file(status)) {
        RenderFile(path, out);
    } else {
        out << "(missing)\n";
    }
}

void Previewer::RenderDirectory(const std::string& dir, std::ostream& out) {
    std::string joined;
    for (const std::string& pattern : settings_.excludes) {
        if (!joined.empty()) {
            joined += "|";
        }
        joined += pattern;
    }
    const std::string depth = std::to_string(settings_.preview_depth);

    std::vector<std::string> eza{"eza", "--tree", "-L", depth, "--group-directories-first", "--color=always", "--icons"};
    if (!joined.empty()) {
        eza.push_back("--ignore-glob=" + joined);
    }
    eza.push_back("--");
    eza.push_back(dir);
    if (RunTool(eza, out)) {
        return;
    }

    std::vector<std::string> tree{"tree", "-a", "-C", "-L", depth};
    if (!joined.empty()) {
        tree.push_back("-I");
        tree.push_back(joined);
    }
    tree.push_back("--");
    tree.push_back(dir);
    if (RunTool(tree, out)) {
        return;
    }

    RenderTree(dir, out);
}

void Previewer::RenderTree(const std::string& dir, std::ostream& out) {
    out << kDirColor << dir << kReset << "\n";
    TreeWalk walk{settings_.excludes, settings_.preview_depth, settings_.preview_max_lines, Deadline(), out};
    walk.Walk(dir, "", 1);
    out << "\n" << walk.dirs << (walk.dirs == 1 ? " directory, " : " directories, ")
        << walk.files << (walk.files == 1 ? " file" : " files") << "\n";
}

bool Previewer::IsTextMime(const std::string& mime) {
    if (mime.rfind("text/", 0) == 0) {
        return true;
    }
    for (const char* marker : {"json", "xml", "x-sh", "javascript"}) {
        if (mime.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool Previewer::LooksTextual(const std::string& sample) {
    return sample.find('\0') == std::string::npos && sample.find('\n') != std::string::npos;
}

bool Previewer::IsTextFile(const std::string& file) {
    std::ostringstream mime;
    if (RunTool({"file", "-b", "--mime-type", "--", file}, mime)) {
        return IsTextMime(Trim(mime.str()));
    }
    return LooksTextual(ReadHead(file, kSniffBytes));
}

void Previewer::RenderFile(const std::string& file, std::ostream& out) {
    std::error_code ec;
    if (std::filesystem::file_size(file, ec) == 0 && !ec) {
        out << "(empty file)\n";
        return;
    }

    if (IsTextFile(file)) {
        RenderExcerpt(file, out);
    } else {
        RenderBinary(file, out);
    }
}

void Previewer::RenderExcerpt(const std::string& file, std::ostream& out) {
    const std::string range = ":" + std::to_string(settings_.preview_max_lines);
    for (const char* bat : {"bat", "batcat"}) {
        if (RunTool({bat, "--color=always", "--pager=never", "--line-range", range, "--", file}, out)) {
            return;
        }
    }

    std::ifstream in(file);
    std::string line;
    for (int count = 0; count < settings_.preview_max_lines && std::getline(in, line); ++count) {
        out << line << "\n";
    }
}

void Previewer::RenderBinary(const std::string& file, std::ostream& out) {
    std::string description;
    try {
        MediaProbe probe(Deadline());
        description = MediaProbe::Describe(probe.Probe(file));
    } catch (const std::exception& e) {
        Log().Debug(std::string("not media: ") + e.what());
    }
    if (description.empty()) {
        std::ostringstream kind;
        if (RunTool({"file", "-b", "--", file}, kind)) {
            description = Trim(kind.str());
        }
    }
    if (description.empty()) {
        description = "binary";
    }
    out << "⚙ " << description << "\n";

    std::error_code ec;
    const std::filesystem::file_status status = std::filesystem::status(file, ec);
    const std::uintmax_t size = std::filesystem::file_size(file, ec);
    if (!ec) {
        out << PermissionString(status) << "  " << HumanSize(size) << "  " << BaseName(file) << "\n";
    }

    const std::string head = ReadHead(file, kDumpBytes);
    if (!head.empty()) {
        out << "\n" << HexDump(head);
    }
}

std::string Previewer::HumanSize(std::uintmax_t bytes) {
    static const char* const kUnits[] = {"B", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%juB", bytes);
    } else if (value < 10.0) {
        std::snprintf(buffer, sizeof(buffer), "%.1f%s", value, kUnits[unit]);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.0f%s", value, kUnits[unit]);
    }
    return buffer;
}

std::string Previewer::HexDump(const std::string& bytes, std::size_t base_offset) {
    std::string out;
    char cell[16];
    for (std::size_t row = 0; row < bytes.size(); row += 16) {
        std::snprintf(cell, sizeof(cell), "%08zx ", base_offset + row);
        out += cell;

        std::string ascii;
        for (std::size_t i = 0; i < 16; ++i) {
            if (i == 8) {
                out += " ";
            }
            if (row + i < bytes.size()) {
                const unsigned char c = static_cast<unsigned char>(bytes[row + i]);
                std::snprintf(cell, sizeof(cell), " %02x", c);
                out += cell;
                ascii.push_back(c >= 0x20 && c < 0x7f ? static_cast<char>(c) : '.');
            } else {
                out += "   ";
            }
        }
        out += "  |" + ascii + "|\n";
    }
    std::snprintf(cell, sizeof(cell), "%08zx\n", base_offset + bytes.size());
    out += cell;
    return out;
}
