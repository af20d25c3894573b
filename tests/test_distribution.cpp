/**
 * @file test_distribution.cpp
 * @brief PrizeDistributor: proportional shares, truncation, independent payouts.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "LocalBank.h"
#include "OwnershipLedger.h"
#include "PrizeDistributor.h"

#include <stdexcept>

namespace {
/** @brief Gateway that throws for one recipient. */
class ThrowingBank : public LocalBank {
public:
    bool transfer(const ActorId& to, Amount amount) override {
        if (to == "boom") throw std::runtime_error("gateway offline");
        return LocalBank::transfer(to, amount);
    }
};
}

BOOST_AUTO_TEST_SUITE(distribution)

BOOST_AUTO_TEST_CASE(shares_are_proportional_and_truncated)
{
    OwnershipLedger l;
    l.increment("a");
    l.increment("b");
    l.increment("b");
    auto plan = PrizeDistributor::plan(100, l);
    BOOST_TEST(plan.size() == 2u);
    BOOST_TEST(plan[0].actor == "a");
    BOOST_TEST(plan[0].cells == 1u);
    BOOST_TEST(plan[0].amount == 33u);
    BOOST_TEST(plan[1].actor == "b");
    BOOST_TEST(plan[1].amount == 66u);
}

BOOST_AUTO_TEST_CASE(every_owner_is_paid_not_only_winners)
{
    OwnershipLedger l;
    for (int i = 0; i < 3; ++i) l.increment("whale");
    l.increment("minnow");
    auto plan = PrizeDistributor::plan(1000, l);
    BOOST_TEST(plan.size() == 2u);
    BOOST_TEST(plan[0].actor == "minnow");
    BOOST_TEST(plan[0].amount == 250u);
    BOOST_TEST(plan[1].amount == 750u);
}

BOOST_AUTO_TEST_CASE(nothing_to_do_for_empty_pool_or_ledger)
{
    OwnershipLedger l;
    BOOST_TEST(PrizeDistributor::plan(500, l).empty());
    l.increment("a");
    BOOST_TEST(PrizeDistributor::plan(0, l).empty());
}

BOOST_AUTO_TEST_CASE(a_failed_payout_does_not_block_others)
{
    OwnershipLedger l;
    l.increment("a");
    l.increment("b");
    l.increment("boom");
    ThrowingBank bank;
    bank.setFailing("b", true);
    auto plan = PrizeDistributor::plan(90, l);
    Amount paid = PrizeDistributor::pay(plan, bank);
    BOOST_TEST(paid == 30u);
    BOOST_TEST(plan[0].delivered);
    BOOST_TEST(!plan[1].delivered);
    BOOST_TEST(!plan[2].delivered);
    BOOST_TEST(bank.balanceOf("a") == 30u);
    BOOST_TEST(bank.balanceOf("b") == 0u);
}

BOOST_AUTO_TEST_CASE(large_pool_uses_wide_intermediate)
{
    OwnershipLedger l;
    l.increment("a");
    l.increment("b");
    l.increment("b");
    const Amount pool = 18000000000000000000ULL;
    auto plan = PrizeDistributor::plan(pool, l);
    BOOST_TEST(plan[0].amount == 6000000000000000000ULL);
    BOOST_TEST(plan[1].amount == 12000000000000000000ULL);
}

BOOST_AUTO_TEST_SUITE_END()
