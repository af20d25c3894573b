/**
 * @file test_bidders.cpp
 * @brief Bidder decisions driven step by step, plus BidderPool thread lifecycle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "Bidder.h"
#include "BidderPool.h"
#include "test_support.h"

#include <chrono>
#include <thread>

namespace {
LedgerConfig singleCell() {
    LedgerConfig cfg = smallConfig();
    cfg.width = 1;
    cfg.height = 1;
    return cfg;
}

struct SingleCellFixture : LedgerFixture {
    SingleCellFixture() : LedgerFixture(singleCell()) {}
};
}

BOOST_AUTO_TEST_SUITE(bidders)

BOOST_FIXTURE_TEST_CASE(bidders_outbid_each_other_and_never_rebuy_their_own_cell, SingleCellFixture)
{
    BidderPool pool(*ledger, bank);
    auto made = pool.populate(2, 1000);
    BOOST_TEST_REQUIRE(made.size() == 2u);
    BOOST_TEST(made[0]->id() == "bidder-001");
    BOOST_TEST(made[1]->id() == "bidder-002");
    BOOST_TEST(pool.symbolFor("bidder-002") == 'B');
    BOOST_TEST(pool.symbolFor("stranger") == '?');
    // Populated but not started: no live threads yet.
    BOOST_TEST(pool.threadCount() == 0u);
    BOOST_TEST(!made[0]->isAlive());

    BOOST_TEST(made[0]->step());
    BOOST_TEST(ledger->getCell(0, 0).owner == "bidder-001");
    BOOST_TEST(ledger->getCell(0, 0).tag == "A");
    BOOST_TEST(!made[0]->step());

    BOOST_TEST(made[1]->step());
    BOOST_TEST(ledger->getCell(0, 0).owner == "bidder-002");
    BOOST_TEST(made[0]->wins() == 1u);
    BOOST_TEST(made[1]->wins() == 1u);
    BOOST_TEST(pool.purchaseCount() == 2u);
    // The first bidder got its 84% of the resale back.
    BOOST_TEST(bank.balanceOf("bidder-001") >= 1000u - 105u + 92u);
}

BOOST_FIXTURE_TEST_CASE(unfunded_bidder_buys_nothing, SingleCellFixture)
{
    BidderPool pool(*ledger, bank);
    auto made = pool.populate(1, 0);
    BOOST_TEST(!made[0]->step());
    BOOST_TEST(ledger->totalOwned() == 0u);
    BOOST_TEST(bank.balanceOf(made[0]->id()) == 0u);
}

BOOST_FIXTURE_TEST_CASE(reseed_starts_threads_and_clear_joins_them, LedgerFixture)
{
    BidderPool pool(*ledger, bank);
    pool.setStepDelayMs(1);
    BOOST_TEST(pool.getStepDelayMs() == 5);
    pool.setRunning(true);
    pool.reseed(3, 100000);
    BOOST_TEST(pool.threadCount() == 3u);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    pool.clear();
    BOOST_TEST(pool.threadCount() == 0u);
    BOOST_TEST(ledger->totalOwned() <= 16u);

    // Serials keep counting so new bidders never reuse an id.
    auto more = pool.populate(1, 0);
    BOOST_TEST(more[0]->id() == "bidder-004");
}

BOOST_AUTO_TEST_SUITE_END()
