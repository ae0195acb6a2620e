#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "config/Config.hpp"
#include "config/Settings.hpp"

TEST(ConfigTest, ParsesShellAndYamlStyleLines) {
    TempDir tmp;
    const std::string path = tmp.MakeFile("fzd.conf",
                                          "# comment\n"
                                          "\n"
                                          "FZD_GLOBAL_MINLEN=3\n"
                                          "export FZD_EXCLUDES=\".git,target\"\n"
                                          "FZD_GLOBAL_ROOT='/srv'\n"
                                          "FZD_DEBUG: yes\n"
                                          "FZD_GLOBAL_MAXDEPTH=4 # shallow\n"
                                          "not a setting\n");
    Config config;
    ASSERT_TRUE(config.LoadFromFile(path));

    EXPECT_EQ(config.GetInt("FZD_GLOBAL_MINLEN", 0), 3);
    EXPECT_EQ(config.GetString("FZD_EXCLUDES", ""), ".git,target");
    EXPECT_EQ(config.GetString("FZD_GLOBAL_ROOT", ""), "/srv");
    EXPECT_TRUE(config.GetBool("FZD_DEBUG", false));
    EXPECT_EQ(config.GetInt("FZD_GLOBAL_MAXDEPTH", 0), 4);
    EXPECT_FALSE(config.Has("not a setting"));
}

TEST(ConfigTest, MissingFileFails) {
    Config config;
    EXPECT_FALSE(config.LoadFromFile("/nonexistent/fzd.conf"));
}

TEST(ConfigTest, BadNumbersFallBack) {
    Config config;
    config.SetString("FZD_GLOBAL_MINLEN", "lots");
    config.SetString("FZD_DEBUG", "maybe");
    EXPECT_EQ(config.GetInt("FZD_GLOBAL_MINLEN", 2), 2);
    EXPECT_TRUE(config.GetBool("FZD_DEBUG", true));
}

TEST(ConfigTest, FileOverridesEnvironment) {
    TempDir tmp;
    const std::string path = tmp.MakeFile("fzd.conf", "FZD_GLOBAL_MAXRESULTS=50\n");
    setenv("FZD_GLOBAL_MAXRESULTS", "999", 1);
    setenv("FZD_GLOBAL_MINLEN", "4", 1);

    Config config;
    config.LoadFromEnvironment();
    ASSERT_TRUE(config.LoadFromFile(path));
    const Settings settings = Settings::FromConfig(config);

    unsetenv("FZD_GLOBAL_MAXRESULTS");
    unsetenv("FZD_GLOBAL_MINLEN");
    EXPECT_EQ(settings.max_results, 50);
    EXPECT_EQ(settings.min_query_length, 4);
}

TEST(ConfigTest, ExpandsVariablesAndHome) {
    Config config;
    config.SetString("HOME", "/home/u");
    config.SetString("USER", "u");
    EXPECT_EQ(config.Expand("~/notes"), "/home/u/notes");
    EXPECT_EQ(config.Expand("/home/$USER /srv/${USER}x"), "/home/u /srv/ux");
    EXPECT_EQ(config.Expand("a $ b"), "a $ b");
}

TEST(SettingsTest, DefaultsWithoutConfig) {
    Config config;
    config.SetString("HOME", "/home/u");
    config.SetString("USER", "u");
    const Settings settings = Settings::FromConfig(config);

    EXPECT_EQ(settings.backend, BackendChoice::Auto);
    EXPECT_EQ(settings.min_query_length, 2);
    EXPECT_EQ(settings.max_results, 1200);
    EXPECT_EQ(settings.max_depth, 6);
    EXPECT_EQ(settings.roots, (std::vector<std::string>{"/etc", "/opt", "/srv", "/mnt", "/home/u"}));
    EXPECT_EQ(settings.excludes, (std::vector<std::string>{".git", "node_modules", ".cache", ".venv", "__pycache__"}));
    EXPECT_EQ(settings.preview_depth, 2);
    EXPECT_EQ(settings.preview_timeout_seconds, 2);
    EXPECT_EQ(settings.state_dir, "/home/u/.local/state/fzd");
    EXPECT_FALSE(settings.debug);
}

TEST(SettingsTest, GlobalPathsExpandEveryItem) {
    Config config;
    config.SetString("HOME", "/home/u");
    config.SetString("FZD_GLOBAL_PATHS", "~/a ~/b $HOME/c");
    const Settings settings = Settings::FromConfig(config);

    EXPECT_EQ(settings.roots, (std::vector<std::string>{"/home/u/a", "/home/u/b", "/home/u/c"}));
}

TEST(SettingsTest, BackendNames) {
    EXPECT_EQ(ParseBackendChoice("locate"), BackendChoice::Indexed);
    EXPECT_EQ(ParseBackendChoice("INDEXED"), BackendChoice::Indexed);
    EXPECT_EQ(ParseBackendChoice("cache"), BackendChoice::RebuiltIndex);
    EXPECT_EQ(ParseBackendChoice("live"), BackendChoice::RebuiltIndex);
    EXPECT_EQ(ParseBackendChoice("disabled"), BackendChoice::Disabled);
    EXPECT_EQ(ParseBackendChoice("whatever"), BackendChoice::Auto);
}

TEST(SettingsTest, SplitListTrimsItems) {
    EXPECT_EQ(SplitList(" a , b,,c ", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(SplitList("/etc   /opt\t/srv", ' '), (std::vector<std::string>{"/etc", "/opt", "/srv"}));
}
