#include "config/Settings.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log/Logger.hpp"
#include "nav/PathCodec.hpp"

namespace {
constexpr const char* kDefaultExcludes = ".git,node_modules,.cache,.venv,__pycache__";
constexpr const char* kDefaultGlobalExcludes =
    "proc,sys,dev,run,proc/*,sys/*,dev/*,run/*,snap,lost+found,var/lib/docker";

int Positive(int value, int fallback) {
    return value > 0 ? value : fallback;
}
}

std::vector<std::string> SplitList(const std::string& text, char separator) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(text);
    if (separator == ' ') {
        while (in >> item) {
            out.push_back(item);
        }
        return out;
    }
    while (std::getline(in, item, separator)) {
        const auto first = std::find_if_not(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        const auto last = std::find_if_not(item.rbegin(), item.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
        if (first < last) {
            out.emplace_back(first, last);
        }
    }
    return out;
}

BackendChoice ParseBackendChoice(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "indexed" || v == "locate") {
        return BackendChoice::Indexed;
    }
    if (v == "rebuilt-index" || v == "cache" || v == "walk" || v == "live") {
        return BackendChoice::RebuiltIndex;
    }
    if (v == "disabled" || v == "none" || v == "off") {
        return BackendChoice::Disabled;
    }
    if (v != "auto") {
        Log().Debug("unknown FZD_GLOBAL_BACKEND '" + name + "', using auto");
    }
    return BackendChoice::Auto;
}

std::vector<std::string> Settings::AllExcludes() const {
    std::vector<std::string> all = excludes;
    all.insert(all.end(), global_excludes.begin(), global_excludes.end());
    return all;
}

Settings Settings::FromConfig(const Config& config) {
    Settings s;

    const std::string home = config.GetString("HOME", "/");
    const std::string cache_home = config.GetString("XDG_CACHE_HOME", home + "/.cache");
    const std::string state_home = config.GetString("XDG_STATE_HOME", home + "/.local/state");
    const std::string runtime_dir = config.GetString("XDG_RUNTIME_DIR", "");

    s.tmp_dir = config.GetString("FZD_TMP_DIR", runtime_dir.empty() ? cache_home + "/fzd/tmp" : runtime_dir + "/fzd");
    s.state_dir = config.GetString("FZD_STATE_DIR", state_home + "/fzd");
    s.cache_dir = config.GetString("FZD_CACHE_DIR", cache_home + "/fzd");

    s.backend = ParseBackendChoice(config.GetString("FZD_GLOBAL_BACKEND", "auto"));
    s.min_query_length = std::max(0, config.GetInt("FZD_GLOBAL_MINLEN", s.min_query_length));
    s.max_results = Positive(config.GetInt("FZD_GLOBAL_MAXRESULTS", s.max_results), s.max_results);
    s.max_depth = Positive(config.GetInt("FZD_GLOBAL_MAXDEPTH", s.max_depth), s.max_depth);

    const std::string user = config.GetString("USER", "");
    const std::string default_paths = "/etc /opt /srv /mnt /home/" + user;
    // Each root is expanded on its own so "~" works past the first one.
    for (const std::string& root : SplitList(config.GetString("FZD_GLOBAL_PATHS", default_paths), ' ')) {
        std::string normalized = NormalizePath(config.Expand(root));
        if (!normalized.empty()) {
            s.roots.push_back(normalized);
        }
    }

    s.excludes = SplitList(config.GetString("FZD_EXCLUDES", kDefaultExcludes), ',');
    s.global_excludes = SplitList(config.GetString("FZD_GLOBAL_XEXCLUDES", kDefaultGlobalExcludes), ',');
    s.locate_dbs = config.GetString("FZD_LOCATE_DBS", "");
    s.global_root_label = config.GetString("FZD_GLOBAL_ROOT", "/");

    s.preview_depth = Positive(config.GetInt("FZD_PREVIEW_DEPTH", s.preview_depth), s.preview_depth);
    s.preview_max_lines = Positive(config.GetInt("FZD_PREVIEW_MAX_LINES", s.preview_max_lines), s.preview_max_lines);
    s.preview_timeout_seconds = std::max(0, config.GetInt("FZD_PREVIEW_TIMEOUT", s.preview_timeout_seconds));

    s.palette = Palette::FromHex(config.GetString("FZD_COLOR_DIR", ""), config.GetString("FZD_COLOR_FILE", ""));
    s.editor = config.GetString("EDITOR", config.GetString("VISUAL", "micro"));
    s.debug = config.GetBool("FZD_DEBUG", false);

    return s;
}

Config LoadConfig() {
    Config config;
    config.LoadFromEnvironment();

    const std::string home = config.GetString("HOME", "/");
    const std::string config_home = config.GetString("XDG_CONFIG_HOME", home + "/.config");
    const std::string conf_file = config.GetString("FZD_CONF_FILE", config_home + "/fzd/fzd.conf");

    std::error_code ec;
    if (std::filesystem::exists(conf_file, ec) && !config.LoadFromFile(conf_file)) {
        Log().Warn("could not read config " + conf_file + "; using environment and defaults");
    }
    return config;
}
