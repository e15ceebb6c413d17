#include "tokentrail/io/AtomicFile.hpp"

#include <fstream>
#include <system_error>

namespace tokentrail::io {

namespace {

bool write_temp_and_flush(const fs::path& temp, std::string_view bytes, std::string* err)
{
    std::ofstream f(temp, std::ios::binary | std::ios::trunc);
    if (!f) {
        if (err) *err = "Failed to open " + temp.string() + " for writing";
        return false;
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
        if (err) *err = "Failed to write " + temp.string();
        return false;
    }
    return true;
}

} // namespace

bool write_atomic(const fs::path& path, std::string_view bytes, std::string* err, bool make_backup)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed: " + ec.message();
            return false;
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";

    if (!write_temp_and_flush(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    if (make_backup && fs::exists(path, ec)) {
        // Best effort; a missing .bak never blocks the save.
        fs::copy_file(path, default_backup_path(path), fs::copy_options::overwrite_existing, ec);
    }

    // rename() replaces the destination atomically on POSIX filesystems.
    fs::rename(tmp, path, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message() + " (code " + std::to_string(ec.value()) + ")";
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

bool read_all(const fs::path& p, std::string& out, std::string* err, std::size_t max_bytes)
{
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
        if (err) *err = "Cannot stat " + p.string() + ": " + ec.message();
        return false;
    }
    if (sz > max_bytes) {
        if (err) *err = "File " + p.string() + " exceeds the " + std::to_string(max_bytes) + " byte limit";
        return false;
    }

    std::ifstream in(p, std::ios::binary);
    if (!in) {
        if (err) *err = "open failed: " + p.string();
        return false;
    }

    out.resize(static_cast<std::size_t>(sz));
    if (sz > 0)
        in.read(out.data(), static_cast<std::streamsize>(sz));
    if (in.gcount() != static_cast<std::streamsize>(sz)) {
        if (err) *err = "short read: " + p.string();
        return false;
    }
    return true;
}

} // namespace tokentrail::io
