#include "tokentrail/game/GameWorld.hpp"
#include "tokentrail/game/SaveFormat.hpp"
#include "tokentrail/io/AtomicFile.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tokentrail {

namespace {

using json = nlohmann::json;

// Everything a save holds, parsed and validated before anything is applied.
struct StagedState {
    LatLng                           player{};
    int                              highestValue = 0;
    bool                             winReached = false;
    std::optional<PlayerToken>       held;
    std::vector<MutationLedger::Entry> ledger;
};

[[nodiscard]] bool IsNumber(const json& v) noexcept
{
    return v.is_number_integer() || v.is_number_unsigned() || v.is_number_float();
}

[[nodiscard]] bool ReadInt(const json& v, int& out) noexcept
{
    if (v.is_number_integer()) {
        const auto x = v.get<std::int64_t>();
        if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max())
            return false;
        out = static_cast<int>(x);
        return true;
    }
    if (v.is_number_unsigned()) {
        const auto x = v.get<std::uint64_t>();
        if (x > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return false;
        out = static_cast<int>(x);
        return true;
    }
    return false;
}

[[nodiscard]] bool ObjDouble(const json& obj, const char* key, double& out) noexcept
{
    auto it = obj.find(key);
    if (it == obj.end() || !IsNumber(*it))
        return false;
    out = it->get<double>();
    return true;
}

[[nodiscard]] bool ObjInt(const json& obj, const char* key, int& out) noexcept
{
    auto it = obj.find(key);
    if (it == obj.end())
        return false;
    return ReadInt(*it, out);
}

[[nodiscard]] bool Fail(std::string* outError, const char* msg)
{
    if (outError) *outError = msg;
    return false;
}

bool StageState(const json& j, StagedState& st, std::string* outError)
{
    if (!j.is_object())
        return Fail(outError, "Save data is not a JSON object.");

    auto fmtIt = j.find("format");
    if (fmtIt == j.end() || !fmtIt->is_string() || fmtIt->get<std::string>() != savefmt::kWorldFormat)
        return Fail(outError, "Unsupported save format.");

    int version = 0;
    if (!ObjInt(j, "version", version) || version < 1 || version > savefmt::kWorldVersion)
        return Fail(outError, "Unsupported save version.");

    // Player
    auto playerIt = j.find("player");
    if (playerIt == j.end() || !playerIt->is_object())
        return Fail(outError, "Missing player block.");
    if (!ObjDouble(*playerIt, "lat", st.player.lat) || !ObjDouble(*playerIt, "lng", st.player.lng))
        return Fail(outError, "Player position is not numeric.");
    if (!IsValidPosition(st.player))
        return Fail(outError, "Player position is out of range.");

    // Highest value / win flag (optional; missing means fresh)
    if (j.contains("highestValue")) {
        if (!ObjInt(j, "highestValue", st.highestValue) || st.highestValue < 0)
            return Fail(outError, "Invalid highestValue.");
    }
    if (auto it = j.find("winReached"); it != j.end()) {
        if (!it->is_boolean())
            return Fail(outError, "Invalid winReached flag.");
        st.winReached = it->get<bool>();
    }

    // Held token
    if (auto it = j.find("heldToken"); it != j.end() && !it->is_null()) {
        if (!it->is_object())
            return Fail(outError, "Invalid heldToken.");
        PlayerToken t;
        if (!ObjInt(*it, "value", t.value) || t.value <= 0 ||
            !ObjInt(*it, "i", t.origin.i) || !ObjInt(*it, "j", t.origin.j))
            return Fail(outError, "Invalid heldToken.");
        st.held = t;
    }

    // Ledger rows: [i, j, hasToken, value]
    auto ledgerIt = j.find("ledger");
    if (ledgerIt != j.end()) {
        if (!ledgerIt->is_array())
            return Fail(outError, "Ledger is not an array.");

        st.ledger.reserve(ledgerIt->size());
        for (const json& row : *ledgerIt) {
            if (!row.is_array() || row.size() != 4)
                return Fail(outError, "Malformed ledger row.");

            GridCoord c;
            int has = 0;
            int value = 0;
            if (!ReadInt(row[0], c.i) || !ReadInt(row[1], c.j) ||
                !ReadInt(row[2], has) || !ReadInt(row[3], value))
                return Fail(outError, "Malformed ledger row.");

            CellState s;
            if (has == 1 && value > 0) {
                s = CellState::WithToken(value);
            } else if (has == 0 && value == 0) {
                s = CellState::Empty();
            } else {
                return Fail(outError, "Ledger row breaks the token invariant.");
            }
            st.ledger.emplace_back(c, s);
        }
    }

    // The record can never be below anything the save contains.
    for (const auto& [c, s] : st.ledger) {
        if (s.hasToken)
            st.highestValue = std::max(st.highestValue, *s.tokenValue);
    }
    if (st.held)
        st.highestValue = std::max(st.highestValue, st.held->value);

    return true;
}

} // namespace

nlohmann::json GameWorld::ExportState() const
{
    json j;
    j["format"]  = savefmt::kWorldFormat;
    j["version"] = savefmt::kWorldVersion;

    j["player"] = { {"lat", m_player.position.lat}, {"lng", m_player.position.lng} };
    j["highestValue"] = m_highest.Value();
    j["winReached"]   = m_highest.ThresholdReached();

    if (m_player.held) {
        j["heldToken"] = {
            {"value", m_player.held->value},
            {"i", m_player.held->origin.i},
            {"j", m_player.held->origin.j},
        };
    } else {
        j["heldToken"] = nullptr;
    }

    // Live cells are already mirrored in the ledger on every change, but the
    // ones never touched are not; snapshot them so the export matches what a
    // full eviction would leave behind.
    MutationLedger merged = m_ledger;
    m_cells.ForEachLive([&merged](const GridCoord& c, const CellState& s) {
        merged.Save(c, s);
    });

    json rows = json::array();
    const auto entries = merged.Entries();
    rows.get_ref<json::array_t&>().reserve(entries.size());
    for (const auto& [c, s] : entries) {
        rows.push_back({ c.i, c.j, s.hasToken ? 1 : 0, s.ValueOr(0) });
    }
    j["ledger"] = std::move(rows);

    return j;
}

bool GameWorld::ImportState(const nlohmann::json& j, std::string* outError)
{
    StagedState st;
    std::string err;
    if (!StageState(j, st, &err)) {
        spdlog::warn("ImportState rejected save: {}", err);
        Reset();
        if (outError) *outError = err;
        return false;
    }

    m_cells.DiscardAll();
    m_ledger.Assign(st.ledger);
    m_highest.Restore(st.highestValue, st.winReached);
    m_player.held = st.held;
    m_view.Invalidate();
    m_view.OnPlayerMoved(st.player);

    spdlog::info("Imported world: {} ledger entries, highest={}, holding={}",
                 m_ledger.Size(), m_highest.Value(), m_player.held ? m_player.held->value : 0);
    return true;
}

bool GameWorld::SaveJson(const std::filesystem::path& path, std::string* outError) const noexcept
{
    try
    {
        const std::string bytes = ExportState().dump(2);

        std::string werr;
        if (!io::write_atomic(path, bytes, &werr, /*make_backup=*/true))
        {
            if (outError) *outError = "Failed to write save file: " + werr;
            return false;
        }

        spdlog::info("Saved world to {}", path.string());
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

bool GameWorld::LoadJson(const std::filesystem::path& path, std::string* outError) noexcept
{
    try
    {
        std::string bytes;
        std::string readErr;
        if (!io::read_all(path, bytes, &readErr))
        {
            Reset();
            if (outError) *outError = "Failed to read save file: " + readErr;
            return false;
        }

        json j = json::parse(bytes, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
        if (j.is_discarded())
        {
            Reset();
            if (outError) *outError = "Save file is not valid JSON.";
            return false;
        }

        return ImportState(j, outError);
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

} // namespace tokentrail
