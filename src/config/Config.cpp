#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

extern char** environ;

namespace {
std::string Trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string Unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    // Unquoted shell values end at a trailing comment.
    const std::size_t hash = s.find(" #");
    if (hash != std::string::npos) {
        return Trim(s.substr(0, hash));
    }
    return s;
}

bool IsImported(const std::string& key) {
    static const char* const kExtra[] = {"EDITOR", "VISUAL", "HOME", "USER", "XDG_CONFIG_HOME",
                                         "XDG_STATE_HOME", "XDG_CACHE_HOME", "XDG_RUNTIME_DIR"};
    if (key.rfind("FZD_", 0) == 0) {
        return true;
    }
    return std::find(std::begin(kExtra), std::end(kExtra), key) != std::end(kExtra);
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}
}

bool Config::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = Trim(trimmed.substr(7));
        }

        const std::size_t eq = trimmed.find('=');
        const std::size_t colon = trimmed.find(':');
        std::size_t split = std::string::npos;
        if (eq != std::string::npos && (colon == std::string::npos || eq < colon)) {
            split = eq;
        } else if (colon != std::string::npos) {
            split = colon;
        }
        if (split == std::string::npos) {
            continue;
        }

        const std::string key = Trim(trimmed.substr(0, split));
        if (key.empty() || !std::all_of(key.begin(), key.end(), IsNameChar)) {
            continue;
        }
        values_[key] = Unquote(Trim(trimmed.substr(split + 1)));
    }

    return true;
}

void Config::LoadFromEnvironment() {
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        const std::string entry(*env);
        const std::size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = entry.substr(0, eq);
        if (IsImported(key)) {
            values_[key] = entry.substr(eq + 1);
        }
    }
}

std::string Config::GetString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

int Config::GetInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool Config::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return fallback;
}

bool Config::Has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void Config::SetString(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::string Config::Expand(const std::string& text) const {
    auto lookup = [this](const std::string& name) -> std::string {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        const char* env = std::getenv(name.c_str());
        return env != nullptr ? std::string(env) : std::string();
    };

    std::string out;
    std::size_t i = 0;
    if (!text.empty() && text[0] == '~' && (text.size() == 1 || text[1] == '/')) {
        out = lookup("HOME");
        i = 1;
    }

    while (i < text.size()) {
        const char c = text[i];
        if (c != '$' || i + 1 >= text.size()) {
            out.push_back(c);
            ++i;
            continue;
        }
        if (text[i + 1] == '{') {
            const std::size_t close = text.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(text, i, std::string::npos);
                break;
            }
            out += lookup(text.substr(i + 2, close - i - 2));
            i = close + 1;
            continue;
        }
        std::size_t end = i + 1;
        while (end < text.size() && IsNameChar(text[end])) {
            ++end;
        }
        if (end == i + 1) {
            out.push_back(c);
            ++i;
            continue;
        }
        out += lookup(text.substr(i + 1, end - i - 1));
        i = end;
    }
    return out;
}
