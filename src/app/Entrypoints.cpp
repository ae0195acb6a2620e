#include "app/Entrypoints.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

#include "app/Editor.hpp"
#include "app/Navigator.hpp"
#include "log/Logger.hpp"
#include "nav/DisplayLines.hpp"
#include "nav/NavigationState.hpp"
#include "picker/FzfPicker.hpp"
#include "preview/Previewer.hpp"
#include "process/Subprocess.hpp"
#include "search/GlobalSearch.hpp"
#include "search/WalkBackend.hpp"
#include "tui/NoticeScreen.hpp"
#include "tui/Signal.hpp"

namespace {
void EnsureDirectory(const std::string& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Log().Debug("cannot create " + dir + ": " + ec.message());
    }
}

void ShowUnavailableNotice() {
    NoticeScreen notice("Global search is unavailable",
                        {"FZD_GLOBAL_BACKEND is set to disabled.", "", "Press Esc to return"});
    if (!notice.Show()) {
        Log().Warn("global search is unavailable");
    }
}
}

Settings LoadSettings() {
    Settings settings = Settings::FromConfig(LoadConfig());
    EnsureDirectory(settings.tmp_dir);
    EnsureDirectory(settings.state_dir);
    EnsureDirectory(settings.cache_dir);
    if (settings.debug && !settings.state_dir.empty()) {
        Log().Open(settings.state_dir + "/fzd.log");
    }
    return settings;
}

std::string QueryFromArgs(const std::vector<std::string>& args) {
    std::size_t first = 0;
    if (!args.empty() && args.front() == "--q") {
        first = 1;
    }
    std::string query;
    for (std::size_t i = first; i < args.size(); ++i) {
        if (i > first) {
            query += " ";
        }
        query += args[i];
    }
    return query;
}

void PrintUsage(std::ostream& out) {
    out << "Usage: fzd [--help] [--version]\n"
           "\n"
           "Browse directories with fzf and print the chosen one.\n"
           "\n"
           "  Enter   open a directory's contents; on a file, open $EDITOR\n"
           "  Right   descend into the highlighted directory\n"
           "  Left    go up one level\n"
           "  Ctrl-F  global search overlay\n"
           "  Esc     quit (exit status 130)\n"
           "\n"
           "Configuration: $FZD_CONF_FILE, default $XDG_CONFIG_HOME/fzd/fzd.conf\n";
}

int RunPreview(const std::vector<std::string>& args) {
    if (args.empty() || args.front().empty()) {
        return 0;
    }
    Settings settings = LoadSettings();
    Previewer previewer(settings);
    previewer.Render(args.front(), std::cout);
    std::cout.flush();
    return 0;
}

int RunGlobalList(const std::vector<std::string>& args) {
    Settings settings = LoadSettings();
    std::unique_ptr<SearchBackend> backend = MakeBackend(settings);
    if (backend == nullptr) {
        return 0;
    }
    const std::string query = QueryFromArgs(args);
    Log().Debug("global list query '" + query + "' via " + backend->Name());
    std::cout << FormatLines(ResultLines(RunQuery(*backend, settings, query), settings.palette));
    std::cout.flush();
    return 0;
}

int RunGlobalIndex() {
    Settings settings = LoadSettings();
    WalkBackend backend(MakeSearchFilter(settings), settings.max_depth, kWalkIndexLimit, WalkBackend::DetectFd());
    std::cout << FormatLines(ResultLines(RunCandidates(backend, settings), settings.palette));
    std::cout.flush();
    return 0;
}

int RunBrowser() {
    InitSignalHandlers();
    Settings settings = LoadSettings();

    const std::string fzf = FindExecutable("fzf");
    if (fzf.empty()) {
        Log().Error("fzf not found");
        return kExitFailure;
    }

    const std::string self = SelfExecutable();
    NavigationState state(StartingDirectory());
    FzfPicker picker(fzf, settings, self);
    ExternalEditor editor(settings.editor);
    GlobalSearch search(settings, picker, editor, self);
    search.SetUnavailableNotice(&ShowUnavailableNotice);

    Log().Debug("start in " + state.CurrentDir());
    Navigator navigator(state, picker, editor, search, settings);
    const SessionResult result = navigator.Run();
    if (result.confirmed) {
        std::cout << result.path << "\n";
        std::cout.flush();
    }
    return ExitCodeFor(result);
}

int Dispatch(const std::vector<std::string>& args) {
    const std::string mode = args.empty() ? "" : args.front();
    const std::vector<std::string> rest(args.empty() ? args.end() : args.begin() + 1, args.end());

    try {
        if (mode == "--_preview") {
            return RunPreview(rest);
        }
        if (mode == "--_global_list") {
            return RunGlobalList(rest);
        }
        if (mode == "--_global_index") {
            return RunGlobalIndex();
        }
        if (mode == "-h" || mode == "--help") {
            PrintUsage(std::cout);
            return 0;
        }
        if (mode == "--version") {
            std::cout << "fzd " << FZD_VERSION << "\n";
            return 0;
        }
        if (!mode.empty()) {
            PrintUsage(std::cerr);
            return kExitFailure;
        }
        return RunBrowser();
    } catch (const std::exception& e) {
        Log().Error(e.what());
        return kExitFailure;
    }
}
