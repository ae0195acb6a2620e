#ifndef CONFIG_CONFIG_HPP
#define CONFIG_CONFIG_HPP

#include <filesystem>
#include <string>
#include <unordered_map>

// Key/value option store fed from the environment and the user's config file.
// The file accepts "KEY=value", "export KEY=value" and "key: value" lines,
// ignoring comments (#) and blank lines. Later loads override earlier ones.
class Config {
public:
    bool LoadFromFile(const std::filesystem::path& path);

    // Imports FZD_* variables plus the few others the options refer to.
    void LoadFromEnvironment();

    // Accessors with defaults.
    std::string GetString(const std::string& key, const std::string& fallback) const;
    int GetInt(const std::string& key, int fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;
    bool Has(const std::string& key) const;

    void SetString(const std::string& key, const std::string& value);

    // Expands $VAR, ${VAR} and a leading ~ using stored values, then the environment.
    std::string Expand(const std::string& text) const;

private:
    std::unordered_map<std::string, std::string> values_;
};

#endif // CONFIG_CONFIG_HPP
