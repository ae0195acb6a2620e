#ifndef CONFIG_SETTINGS_HPP
#define CONFIG_SETTINGS_HPP

#include <string>
#include <vector>

#include "config/Config.hpp"
#include "nav/DisplayLines.hpp"

enum class BackendChoice {
    Auto,
    Indexed,
    RebuiltIndex,
    Disabled
};

// Typed view of every option, with defaults applied.
struct Settings {
    // Global search.
    BackendChoice backend = BackendChoice::Auto;
    int min_query_length = 2;
    int max_results = 1200;
    int max_depth = 6;
    std::vector<std::string> roots;
    std::vector<std::string> excludes;
    std::vector<std::string> global_excludes;
    std::string locate_dbs;
    std::string global_root_label = "/";

    // Preview.
    int preview_depth = 2;
    int preview_max_lines = 200;
    int preview_timeout_seconds = 2;

    Palette palette;
    std::string editor = "micro";
    bool debug = false;

    std::string tmp_dir;
    std::string state_dir;
    std::string cache_dir;

    // Both exclude lists, as applied to global search results.
    std::vector<std::string> AllExcludes() const;

    static Settings FromConfig(const Config& config);
};

// Defaults < environment < config file ($FZD_CONF_FILE or $XDG_CONFIG_HOME/fzd/fzd.conf).
Config LoadConfig();

// Unknown names map to Auto.
BackendChoice ParseBackendChoice(const std::string& name);

std::vector<std::string> SplitList(const std::string& text, char separator);

#endif // CONFIG_SETTINGS_HPP
