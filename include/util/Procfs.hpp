// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autogrow::util {

// Map an absolute /proc path to an alternate root if AUTOGROW_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if AUTOGROW_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string (/proc and /sys paths are remapped).
// Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first unsigned integer in a file, e.g. /sys/class/block/sda/size
auto read_file_u64(const std::string& abs) -> std::optional<uint64_t>;

// List directory entries (names only, sorted). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// True if the (remapped) path exists
bool path_exists(const std::string& abs);

} // namespace autogrow::util
