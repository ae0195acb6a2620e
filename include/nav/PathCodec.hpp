#ifndef NAV_PATHCODEC_HPP
#define NAV_PATHCODEC_HPP

#include <optional>
#include <string>

// Base64 tokens that carry absolute paths through one tab-delimited picker line.
std::string EncodePath(const std::string& path);

// Returns an empty optional for empty or malformed tokens.
std::optional<std::string> DecodePath(const std::string& token);

// Collapses duplicate separators and strips the trailing slash (except for "/").
std::string NormalizePath(const std::string& path);

// Parent directory of a normalized path; the parent of "/" is "/".
std::string ParentOf(const std::string& path);

std::string BaseName(const std::string& path);

std::string JoinPath(const std::string& base, const std::string& child);

#endif // NAV_PATHCODEC_HPP
