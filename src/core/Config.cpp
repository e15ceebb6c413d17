#include "tokentrail/core/Config.hpp"
#include "tokentrail/io/AtomicFile.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace tokentrail::core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / kConfigFileName;
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view TrimView(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <typename T>
static bool ParseNumber(std::string_view sv, T& out) noexcept
{
    sv = TrimView(sv);
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || sv.empty())
        return false;

    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(v))
            return false;
    }

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = TrimView(sv);

    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

static void Sanitize(Config& cfg) noexcept
{
    if (!(cfg.cellDegrees > 0.0) || cfg.cellDegrees > 1.0)
        cfg.cellDegrees = Config{}.cellDegrees;
    cfg.viewRadiusCells        = std::clamp(cfg.viewRadiusCells, 0, 256);
    cfg.collectionRadiusMeters = std::max(0.0, cfg.collectionRadiusMeters);
    cfg.winThreshold           = std::max(1, cfg.winThreshold);
    cfg.originLat              = std::clamp(cfg.originLat, -90.0, 90.0);
    cfg.originLng              = std::clamp(cfg.originLng, -180.0, 180.0);
}

template <typename T>
static void Assign(std::string_view key, std::string_view v, T& field)
{
    T parsed = field;
    if (ParseNumber(v, parsed))
        field = parsed;
    else
        spdlog::warn("LoadConfig: ignoring bad value '{}' for {}", v, key);
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& saveDir)
{
    const auto path = Path(saveDir);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err, /*max_bytes=*/1024u * 1024u))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", path.string(), err);
        return false;
    }

    // Editors on some platforms prepend a UTF-8 BOM.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments. A marker only counts at the start of
        // the value or after whitespace, so saveFile=slot#1.json stays whole:
        //   viewRadiusCells=24  # cells
        //   worldSeed=7         ; any integer
        for (std::size_t i = 0; i < v.size(); ++i)
        {
            if (i > 0 && !std::isspace(static_cast<unsigned char>(v[i - 1])))
                continue;
            if (v[i] == '#' || v[i] == ';' || v.compare(i, 2, "//") == 0)
            {
                v.erase(i);
                TrimInPlace(v);
                break;
            }
        }

        if (k.empty()) continue;

        if (k == "cellDegrees")                 Assign(k, v, cfg.cellDegrees);
        else if (k == "viewRadiusCells")        Assign(k, v, cfg.viewRadiusCells);
        else if (k == "collectionRadiusMeters") Assign(k, v, cfg.collectionRadiusMeters);
        else if (k == "winThreshold")           Assign(k, v, cfg.winThreshold);
        else if (k == "originLat")              Assign(k, v, cfg.originLat);
        else if (k == "originLng")              Assign(k, v, cfg.originLng);
        else if (k == "worldSeed")              Assign(k, v, cfg.worldSeed);
        else if (k == "saveFile")
        {
            if (!v.empty())
                cfg.saveFile = v;
        }
        else if (k == "logLevel")
        {
            if (!v.empty())
                cfg.logLevel = v;
        }
        else if (k == "asyncLogging")
        {
            bool parsed = cfg.asyncLogging;
            if (ParseBool(v, parsed))
                cfg.asyncLogging = parsed;
        }
        else
        {
            spdlog::debug("LoadConfig: unknown key '{}'", k);
        }
    }

    Sanitize(cfg);
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& saveDir)
{
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "cellDegrees="            << cfg.cellDegrees            << "\n";
    oss << "viewRadiusCells="        << cfg.viewRadiusCells        << "\n";
    oss << "collectionRadiusMeters=" << cfg.collectionRadiusMeters << "\n";
    oss << "winThreshold="           << cfg.winThreshold           << "\n";
    oss << "originLat="              << cfg.originLat              << "\n";
    oss << "originLng="              << cfg.originLng              << "\n";
    oss << "worldSeed="              << cfg.worldSeed              << "\n";
    oss << "saveFile="               << cfg.saveFile               << "\n";
    oss << "logLevel="               << cfg.logLevel               << "\n";
    oss << "asyncLogging="           << (cfg.asyncLogging ? 1 : 0) << "\n";

    const auto path = Path(saveDir);

    std::string err;
    if (!io::write_atomic(path, oss.str(), &err, /*make_backup=*/false))
    {
        spdlog::error("SaveConfig: write failed for {} ({})", path.string(), err);
        return false;
    }
    return true;
}

} // namespace tokentrail::core
