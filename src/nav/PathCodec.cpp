#include "nav/PathCodec.hpp"

#include <array>
#include <cstdint>

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> BuildReverseTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}
}

std::string EncodePath(const std::string& path) {
    std::string out;
    out.reserve(((path.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= path.size()) {
        const std::uint32_t chunk = (static_cast<unsigned char>(path[i]) << 16) |
                                    (static_cast<unsigned char>(path[i + 1]) << 8) |
                                    static_cast<unsigned char>(path[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
        i += 3;
    }

    const std::size_t rest = path.size() - i;
    if (rest == 1) {
        const std::uint32_t chunk = static_cast<unsigned char>(path[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t chunk = (static_cast<unsigned char>(path[i]) << 16) |
                                    (static_cast<unsigned char>(path[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::string> DecodePath(const std::string& token) {
    static const std::array<int, 256> reverse = BuildReverseTable();

    if (token.empty() || token.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (token.back() == '=') {
        padding = token[token.size() - 2] == '=' ? 2 : 1;
    }

    std::string out;
    out.reserve((token.size() / 4) * 3);
    for (std::size_t i = 0; i < token.size(); i += 4) {
        const bool last_group = i + 4 == token.size();
        std::uint32_t chunk = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = token[i + j];
            if (c == '=') {
                // Padding is only legal at the tail of the final group.
                if (!last_group || j < 4 - padding) {
                    return std::nullopt;
                }
                chunk <<= 6;
                continue;
            }
            const int value = reverse[static_cast<unsigned char>(c)];
            if (value < 0) {
                return std::nullopt;
            }
            chunk = (chunk << 6) | static_cast<std::uint32_t>(value);
        }

        out.push_back(static_cast<char>((chunk >> 16) & 0xFF));
        if (!last_group || padding < 2) {
            out.push_back(static_cast<char>((chunk >> 8) & 0xFF));
        }
        if (!last_group || padding < 1) {
            out.push_back(static_cast<char>(chunk & 0xFF));
        }
    }

    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

std::string NormalizePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::string ParentOf(const std::string& path) {
    const std::string normalized = NormalizePath(path);
    const std::size_t slash = normalized.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return normalized.substr(0, slash);
}

std::string BaseName(const std::string& path) {
    const std::string normalized = NormalizePath(path);
    if (normalized == "/") {
        return "/";
    }
    const std::size_t slash = normalized.rfind('/');
    if (slash == std::string::npos) {
        return normalized;
    }
    return normalized.substr(slash + 1);
}

std::string JoinPath(const std::string& base, const std::string& child) {
    std::string trimmed = child;
    while (!trimmed.empty() && trimmed.front() == '/') {
        trimmed.erase(trimmed.begin());
    }
    if (base == "/") {
        return "/" + trimmed;
    }
    return base + "/" + trimmed;
}
