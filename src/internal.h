#pragma once
/// Internal helpers shared between txcopy source files.
/// Not part of the public API.

#include "txcopy/error.h"
#include "txcopy/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace txcopy {

// ---------------------------------------------------------------------------
// paths: local path helpers
// ---------------------------------------------------------------------------

namespace paths {

/// `path` with exactly one trailing '/' ("a" -> "a/", "a//" -> "a/").
std::string dir_form(const std::string& path);

/// True if `path` (following symlinks) is a directory.
bool is_directory(const std::string& path);

/// Absolute, lexically normalized form of `path`, without a trailing
/// separator.  Does not resolve symlinks.
std::string absolute(const std::string& path);

/// Last component of `path`, ignoring trailing separators.
std::string basename(const std::string& path);

} // namespace paths

// ---------------------------------------------------------------------------
// trashinfo: freedesktop.org .trashinfo encoding
// ---------------------------------------------------------------------------

namespace trashinfo {

std::string percent_encode(const std::string& path);
std::string percent_decode(const std::string& s);

/// Current local time as "YYYY-MM-DDThh:mm:ss".
std::string now_string();

/// Render the contents of a .trashinfo file.
std::string format(const std::string& original_path,
                   const std::string& deletion_date);

/// Parse a .trashinfo file body.  Returns nullopt when the
/// "[Trash Info]" header or the Path key is missing.
std::optional<TrashEntry> parse(const std::string& name,
                                const std::string& body);

} // namespace trashinfo

} // namespace txcopy
