#ifndef APP_EDITOR_HPP
#define APP_EDITOR_HPP

#include <string>
#include <vector>

// Opens a file for the user and returns when they are done with it.
class Editor {
public:
    virtual ~Editor() = default;

    virtual void Open(const std::string& path) = 0;
};

// Runs $EDITOR (or $VISUAL, or micro) on the terminal. Failures are logged, never fatal.
class ExternalEditor : public Editor {
public:
    explicit ExternalEditor(const std::string& command);

    void Open(const std::string& path) override;

    // Command words followed by "--" and the path.
    std::vector<std::string> BuildCommand(const std::string& path) const;

private:
    std::vector<std::string> command_;
};

#endif // APP_EDITOR_HPP
