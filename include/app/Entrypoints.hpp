#ifndef APP_ENTRYPOINTS_HPP
#define APP_ENTRYPOINTS_HPP

#include <ostream>
#include <string>
#include <vector>

#include "config/Settings.hpp"

#ifndef FZD_VERSION
#define FZD_VERSION "0.1.0"
#endif

// Exit status when fzf cannot be found or an unexpected error escapes.
constexpr int kExitFailure = 1;

// Picks the entrypoint from argv[1]. Hidden "--_*" modes are the callbacks
// fzf runs for previews and live reloads.
int Dispatch(const std::vector<std::string>& args);

// Interactive browser; prints the confirmed directory on stdout.
int RunBrowser();

int RunPreview(const std::vector<std::string>& args);
int RunGlobalList(const std::vector<std::string>& args);
int RunGlobalIndex();

void PrintUsage(std::ostream& out);

// Query text of "--_global_list [--q] WORDS..." with the words joined by spaces.
std::string QueryFromArgs(const std::vector<std::string>& args);

// Loads settings, creates the runtime directories and opens the debug log.
Settings LoadSettings();

#endif // APP_ENTRYPOINTS_HPP
