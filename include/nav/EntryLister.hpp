#ifndef NAV_ENTRYLISTER_HPP
#define NAV_ENTRYLISTER_HPP

#include <string>
#include <vector>

// Sorted snapshot of one directory. Directory names carry a trailing '/'.
struct Listing {
    std::vector<std::string> dirs;
    std::vector<std::string> files;
};

// Lists subdirectories and regular files, hidden entries included.
// An unreadable directory yields an empty listing.
Listing ListDirectory(const std::string& dir);

// Case-insensitive ordering with ASCII letters folded to upper case; ties fall back to raw bytes.
bool FoldedLess(const std::string& a, const std::string& b);

#endif // NAV_ENTRYLISTER_HPP
