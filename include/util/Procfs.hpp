// Helpers for reading /proc with optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace pui::util {

// Map an absolute /proc path to an alternate root if PUI_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read a symlink target (e.g. /proc/<pid>/fd/<n>). Returns std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// True if the name is a non-empty run of decimal digits (pid, fd).
[[nodiscard]] bool is_number(const std::string& s);

} // namespace pui::util
