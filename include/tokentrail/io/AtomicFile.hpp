// include/tokentrail/io/AtomicFile.hpp
//
// Atomic file writes and whole-file reads for save games and config.
//
// write_atomic writes a sibling "<final>.tmp", flushes it, optionally keeps the
// previous file as "<final>.bak", then renames the temp file over the target.
// A crash mid-write leaves either the old or the new file, never a torn one.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace tokentrail::io {

namespace fs = std::filesystem;

/// Atomically replace `final_path` with `bytes`.
/// Creates missing parent directories.
/// @return true on success; false with `err` populated (if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr,
                                bool make_backup = true);

/// Read the entire file at `path` into `out`. Refuses files over `max_bytes`.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr,
                            std::size_t max_bytes = 64u * 1024u * 1024u);

/// "<final>.bak", as produced by write_atomic(make_backup = true).
[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace tokentrail::io
