#include <doctest/doctest.h>

#include "tokentrail/world/CellStore.hpp"
#include "test_support/world_fixtures.h"

#include <stdexcept>

using namespace tokentrail;

namespace {

struct StoreFixture {
    test::TableLuck     luck;
    CellGenerator       generator{ luck };
    MutationLedger      ledger;
    test::RecordingScore score;
    HighestValueRecord  highest{ score };
    test::RecordingRenderer renderer;
    CellStore           store{ ledger, generator, highest, renderer };
};

} // namespace

TEST_CASE("CellStore::Materialize is idempotent")
{
    StoreFixture f;
    f.luck.Set({ 1, 1 }, 2);

    const CellState& first = f.store.Materialize({ 1, 1 });
    CHECK(first.tokenValue == 2);
    const CellState& again = f.store.Materialize({ 1, 1 });
    CHECK(&first == &again);

    CHECK(f.store.LiveCount() == 1u);
    CHECK(f.store.GetStats().materialized == 1u);
    CHECK(f.store.GetStats().generated == 1u);
    CHECK(f.renderer.materialized == 1);

    // Materializing a token-bearing cell feeds the highest-value record.
    CHECK(f.highest.Value() == 2);
}

TEST_CASE("CellStore: an evicted cell comes back from the ledger, not the generator")
{
    StoreFixture f;
    f.luck.Set({ 1, 1 }, 2);

    f.store.Materialize({ 1, 1 });
    f.store.SetState({ 1, 1 }, CellState::Empty());
    f.store.Evict({ 1, 1 });

    CHECK_FALSE(f.store.IsLive({ 1, 1 }));
    CHECK(f.store.Find({ 1, 1 }) == nullptr);
    CHECK(f.renderer.evicted == 1);

    const CellState& back = f.store.Materialize({ 1, 1 });
    CHECK_FALSE(back.hasToken);
    CHECK_FALSE(back.tokenValue.has_value());
    CHECK(f.store.GetStats().restored == 1u);
    CHECK(f.store.GetStats().generated == 1u);
}

TEST_CASE("CellStore::Evict snapshots untouched cells too")
{
    StoreFixture f;
    f.luck.Set({ 4, 4 }, 1);

    f.store.Materialize({ 4, 4 });
    CHECK_FALSE(f.ledger.Contains({ 4, 4 }));

    f.store.Evict({ 4, 4 });
    REQUIRE(f.ledger.Contains({ 4, 4 }));
    CHECK(f.ledger.Restore({ 4, 4 })->tokenValue == 1);

    // Evicting something that is not live does nothing.
    f.store.Evict({ 100, 100 });
    CHECK(f.store.GetStats().evicted == 1u);
}

TEST_CASE("CellStore::SetState requires a live cell and a valid state")
{
    StoreFixture f;

    CHECK_THROWS_AS(f.store.SetState({ 0, 0 }, CellState::Empty()), std::logic_error);

    f.store.Materialize({ 0, 0 });

    CellState broken;
    broken.hasToken = true; // no value
    CHECK_THROWS_AS(f.store.SetState({ 0, 0 }, broken), std::invalid_argument);

    f.store.SetState({ 0, 0 }, CellState::WithToken(8));
    CHECK(f.store.Find({ 0, 0 })->tokenValue == 8);
    CHECK(f.ledger.Restore({ 0, 0 })->tokenValue == 8);
    CHECK(f.renderer.updated == 1);
    CHECK(f.highest.Value() == 8);
}

TEST_CASE("CellStore::WriteThrough updates off-screen cells in the ledger only")
{
    StoreFixture f;

    f.store.WriteThrough({ 30, 30 }, CellState::WithToken(4));
    CHECK_FALSE(f.store.IsLive({ 30, 30 }));
    CHECK(f.ledger.Restore({ 30, 30 })->tokenValue == 4);
    CHECK(f.renderer.updated == 0);

    const CellState& s = f.store.Materialize({ 30, 30 });
    CHECK(s.tokenValue == 4);

    f.store.WriteThrough({ 30, 30 }, CellState::Empty());
    CHECK(f.renderer.updated == 1);
    CHECK_FALSE(f.store.Find({ 30, 30 })->hasToken);
}

TEST_CASE("CellStore::DiscardAll drops live cells and leaves the ledger alone")
{
    StoreFixture f;
    f.ledger.Save({ 7, 7 }, CellState::WithToken(2));

    for (int i = 0; i < 3; ++i)
        f.store.Materialize({ i, 0 });

    f.store.DiscardAll();
    CHECK(f.store.LiveCount() == 0u);
    CHECK(f.renderer.evicted == 3);
    CHECK(f.ledger.Size() == 1u);

    int visited = 0;
    f.store.ForEachLive([&visited](const GridCoord&, const CellState&) { ++visited; });
    CHECK(visited == 0);
}
