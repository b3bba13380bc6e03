#pragma once

#include "pathsafe/export.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pathsafe {

// Drive/root prefix and the remainder of a path
struct DriveSplit {
    std::string drive;
    std::string tail;
};

inline bool is_path_separator(char c) {
    return c == '/' || c == '\\';
}

// Split a drive letter ("C:") or UNC share ("\\server\share") from a path.
// Either separator is accepted. Returns an empty drive when there is none.
PATHSAFE_API DriveSplit split_drive_nt(const std::string& path);

// POSIX paths have no drive: the whole input is the tail
PATHSAFE_API DriveSplit split_drive_posix(const std::string& path);

// Starts with '/'
PATHSAFE_API bool is_posix_abs(const std::string& path);

// UNC share, or a drive letter followed by a separator
PATHSAFE_API bool is_nt_abs(const std::string& path);

// Split on both separators, keeping empty components
PATHSAFE_API std::vector<std::string> split_components(const std::string& path);

// Lexically collapse "." and ".." segments and redundant separators (string-based,
// no filesystem access). Both separators are recognised; the result uses '/'.
// - A leading separator is kept and ".." never climbs above it
// - Leading ".." segments of a relative path are kept
// - An empty result becomes "."
PATHSAFE_API std::string normalize_path(const std::string& path);

// Stem of the last component: POSIX basename with the final extension removed.
// Leading dots do not start an extension (".bashrc" stays ".bashrc").
PATHSAFE_API std::string extract_root_name(const std::string& path);

// Empty, or only ASCII whitespace
PATHSAFE_API bool is_blank(const std::string& s);

PATHSAFE_API std::string to_upper_ascii(const std::string& s);

// Length in UTF-8 code points
PATHSAFE_API std::size_t utf8_length(const std::string& s);

// Keep at most max_code_points code points, never splitting a sequence
PATHSAFE_API std::string utf8_truncate(const std::string& s, std::size_t max_code_points);

} // namespace pathsafe
