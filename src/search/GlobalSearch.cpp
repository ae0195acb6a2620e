#include "search/GlobalSearch.hpp"

#include <filesystem>
#include <system_error>

#include "app/Editor.hpp"
#include "log/Logger.hpp"
#include "nav/NavigationState.hpp"
#include "nav/PathCodec.hpp"
#include "picker/Picker.hpp"
#include "process/Subprocess.hpp"
#include "search/LocateBackend.hpp"
#include "search/WalkBackend.hpp"

namespace {
bool IsDirectory(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool IsRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}
}

BackendKind SelectBackendKind(BackendChoice choice, bool locate_available) {
    switch (choice) {
        case BackendChoice::Disabled:
            return BackendKind::None;
        case BackendChoice::RebuiltIndex:
            return BackendKind::Walk;
        case BackendChoice::Auto:
        case BackendChoice::Indexed:
            return locate_available ? BackendKind::Indexed : BackendKind::Walk;
    }
    return BackendKind::None;
}

SearchFilter MakeSearchFilter(const Settings& settings) {
    return SearchFilter(settings.roots, settings.AllExcludes());
}

std::unique_ptr<SearchBackend> MakeBackendOfKind(BackendKind kind, const Settings& settings,
                                                 const std::string& locate_binary) {
    switch (kind) {
        case BackendKind::Indexed:
            return std::make_unique<LocateBackend>(locate_binary, settings.locate_dbs);
        case BackendKind::Walk:
            return std::make_unique<WalkBackend>(MakeSearchFilter(settings), settings.max_depth, kWalkIndexLimit,
                                                 WalkBackend::DetectFd());
        case BackendKind::None:
            break;
    }
    return nullptr;
}

std::unique_ptr<SearchBackend> MakeBackend(const Settings& settings) {
    const std::string locate = LocateBackend::Detect();
    const BackendKind kind = SelectBackendKind(settings.backend, !locate.empty());
    if (settings.backend == BackendChoice::Indexed && kind != BackendKind::Indexed) {
        Log().Debug("no plocate/locate installed, falling back to a directory walk");
    }
    return MakeBackendOfKind(kind, settings, locate);
}

std::vector<SearchResult> RunQuery(SearchBackend& backend, const Settings& settings, const std::string& query) {
    if (static_cast<int>(query.size()) < settings.min_query_length) {
        return {};
    }
    return MakeSearchFilter(settings).Apply(backend.Search(query), static_cast<std::size_t>(settings.max_results));
}

std::vector<SearchResult> RunCandidates(SearchBackend& backend, const Settings& settings) {
    return MakeSearchFilter(settings).Apply(backend.Search(""), static_cast<std::size_t>(settings.max_results));
}

std::vector<DisplayLine> ResultLines(const std::vector<SearchResult>& results, const Palette& palette) {
    std::vector<DisplayLine> lines;
    lines.reserve(results.size());
    for (const SearchResult& result : results) {
        lines.push_back(MakeLine(result.path, result.is_dir, palette));
    }
    return lines;
}

GlobalSearch::GlobalSearch(const Settings& settings, Picker& picker, Editor& editor, std::string self_exe)
    : settings_(settings),
      picker_(picker),
      editor_(editor),
      self_exe_(std::move(self_exe)),
      factory_([&settings]() { return MakeBackend(settings); }) {}

std::string GlobalSearch::Prompt() const {
    std::string root = settings_.global_root_label;
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }
    return "global:" + root + "/ > ";
}

GlobalSearch::Outcome GlobalSearch::Run(NavigationState& state) {
    std::unique_ptr<SearchBackend> backend = factory_ ? factory_() : nullptr;
    if (backend == nullptr) {
        Log().Debug("global search unavailable");
        if (notice_) {
            notice_();
        }
        return Outcome::Resume;
    }
    Log().Debug(std::string("global overlay start (backend=") + backend->Name() + ")");

    FrameRequest request;
    request.mode = FrameRequest::Mode::Overlay;
    request.prompt = Prompt();
    if (backend->IsLive()) {
        request.reload_command = ShellQuote(self_exe_) + " --_global_list --q {q}";
    } else {
        request.lines = ResultLines(RunCandidates(*backend, settings_), settings_.palette);
    }

    const Action action = picker_.RunFrame(request);
    const std::string path = NormalizePath(DecodePath(action.token).value_or(""));

    switch (action.kind) {
        case ActionKind::Into:
            if (IsDirectory(path)) {
                state.Down(path);
            }
            return Outcome::Resume;
        case ActionKind::Enter:
            if (IsDirectory(path)) {
                state.Confirm(path);
                return Outcome::Confirmed;
            }
            if (IsRegularFile(path)) {
                editor_.Open(path);
                state.ArriveAtFile(path);
            }
            return Outcome::Resume;
        default:
            Log().Debug("global overlay closed");
            return Outcome::Resume;
    }
}
