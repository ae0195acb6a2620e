#ifndef PREVIEW_PREVIEWER_HPP
#define PREVIEW_PREVIEWER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "config/Settings.hpp"

// Renders the preview pane for one path token. Runs in its own process,
// spawned by the picker for the highlighted line; every external renderer
// is bounded by the preview timeout.
class Previewer {
public:
    explicit Previewer(const Settings& settings);

    // Empty or malformed tokens produce no output.
    void Render(const std::string& token, std::ostream& out);

    void RenderDirectory(const std::string& dir, std::ostream& out);
    void RenderFile(const std::string& file, std::ostream& out);

    // Depth-limited colorized tree, used when neither eza nor tree is installed.
    void RenderTree(const std::string& dir, std::ostream& out);

    // No NUL bytes and at least one newline in the sample.
    static bool LooksTextual(const std::string& sample);

    // MIME types shown as text.
    static bool IsTextMime(const std::string& mime);

    // "hexdump -C" layout: offset, 16 hex bytes in two groups, ASCII gutter.
    static std::string HexDump(const std::string& bytes, std::size_t base_offset = 0);

    static std::string HumanSize(std::uintmax_t bytes);

private:
    // Runs a renderer with the preview timeout. Returns false when the tool is not installed.
    bool RunTool(const std::vector<std::string>& argv, std::ostream& out);
    bool IsTextFile(const std::string& file);
    void RenderExcerpt(const std::string& file, std::ostream& out);
    void RenderBinary(const std::string& file, std::ostream& out);
    std::chrono::steady_clock::time_point Deadline() const;

    const Settings& settings_;
    std::chrono::steady_clock::time_point started_;
};

#endif // PREVIEW_PREVIEWER_HPP
