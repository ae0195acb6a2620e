#include "nav/EntryLister.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "log/Logger.hpp"

namespace {
unsigned char Fold(char c) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 'a' && uc <= 'z') {
        return static_cast<unsigned char>(uc - 'a' + 'A');
    }
    return uc;
}
}

bool FoldedLess(const std::string& a, const std::string& b) {
    const std::size_t common = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < common; ++i) {
        const unsigned char fa = Fold(a[i]);
        const unsigned char fb = Fold(b[i]);
        if (fa != fb) {
            return fa < fb;
        }
    }
    if (a.size() != b.size()) {
        return a.size() < b.size();
    }
    return a < b;
}

Listing ListDirectory(const std::string& dir) {
    Listing listing;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        Log().Debug("list " + dir + ": " + ec.message());
        return listing;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Log().Debug("list " + dir + ": " + ec.message());
            break;
        }
        const std::filesystem::directory_entry& dirent = *it;
        const std::string name = dirent.path().filename().string();

        std::error_code kind_ec;
        if (dirent.is_directory(kind_ec)) {
            listing.dirs.push_back(name + "/");
        } else if (dirent.is_regular_file(kind_ec)) {
            listing.files.push_back(name);
        }
    }

    // A listing cut short by an error is still shown; the next frame retries.
    std::sort(listing.dirs.begin(), listing.dirs.end(), FoldedLess);
    std::sort(listing.files.begin(), listing.files.end(), FoldedLess);
    return listing;
}
