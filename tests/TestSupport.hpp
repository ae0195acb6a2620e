#ifndef TESTS_TESTSUPPORT_HPP
#define TESTS_TESTSUPPORT_HPP

#include <deque>
#include <string>
#include <vector>

#include "app/Editor.hpp"
#include "picker/Picker.hpp"
#include "search/SearchBackend.hpp"

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& Path() const { return path_; }

    // Both return the absolute path and create missing parents.
    std::string MakeDir(const std::string& relative) const;
    std::string MakeFile(const std::string& relative, const std::string& content = "hello\n") const;

    // Executable /bin/sh script with the given body.
    std::string MakeScript(const std::string& relative, const std::string& body) const;

private:
    std::string path_;
};

// Replays queued actions and records every frame it was asked to render.
class ScriptedPicker : public Picker {
public:
    void Push(ActionKind kind, const std::string& path = "");

    Action RunFrame(const FrameRequest& request) override;

    std::vector<FrameRequest> frames;

private:
    std::deque<Action> script_;
};

class RecordingEditor : public Editor {
public:
    void Open(const std::string& path) override { opened.push_back(path); }

    std::vector<std::string> opened;
};

// Backend over a fixed candidate list; Search does a case-insensitive substring match.
class FixedBackend : public SearchBackend {
public:
    FixedBackend(std::vector<SearchResult> candidates, bool live);

    bool IsLive() const override { return live_; }
    const char* Name() const override { return "fixed"; }
    std::vector<SearchResult> Search(const std::string& query) override;

    std::vector<std::string> queries;

private:
    std::vector<SearchResult> candidates_;
    bool live_;
};

#endif // TESTS_TESTSUPPORT_HPP
