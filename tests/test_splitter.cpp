/**
 * @file test_splitter.cpp
 * @brief PaymentSplitter: share arithmetic, remainder handling, configuration checks.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "PaymentSplitter.h"

#include <stdexcept>

BOOST_AUTO_TEST_SUITE(splitter)

BOOST_AUTO_TEST_CASE(resale_pays_previous_owner_and_carries_remainder_to_pool)
{
    PaymentSplitter s(84, 15, 1);
    PaymentSplit r = s.split(110, true);
    BOOST_TEST(r.previousOwnerShare == 92u);
    BOOST_TEST(r.operatorShare == 1u);
    BOOST_TEST(r.carry == 1u);
    BOOST_TEST(r.poolShare == 17u); // 16 + carry
    BOOST_TEST(r.total() == 110u);
}

BOOST_AUTO_TEST_CASE(fresh_cell_redirects_owner_share_to_pool)
{
    PaymentSplitter s(84, 15, 1);
    PaymentSplit r = s.split(100, false);
    BOOST_TEST(r.previousOwnerShare == 0u);
    BOOST_TEST(r.poolShare == 99u);
    BOOST_TEST(r.operatorShare == 1u);
    BOOST_TEST(r.carry == 0u);
}

BOOST_AUTO_TEST_CASE(small_amounts_lose_nothing)
{
    PaymentSplitter s(84, 15, 1);
    PaymentSplit one = s.split(1, false);
    BOOST_TEST(one.poolShare == 1u);
    BOOST_TEST(one.operatorShare == 0u);

    PaymentSplit r = s.split(99, true);
    BOOST_TEST(r.previousOwnerShare == 83u);
    BOOST_TEST(r.operatorShare == 0u);
    BOOST_TEST(r.carry == 2u);
    BOOST_TEST(r.poolShare == 16u);

    PaymentSplit zero = s.split(0, true);
    BOOST_TEST(zero.total() == 0u);
}

BOOST_AUTO_TEST_CASE(components_always_sum_to_amount)
{
    PaymentSplitter s(84, 15, 1);
    for (Amount a = 0; a < 2000; a += 7) {
        BOOST_TEST(s.split(a, true).total() == a);
        BOOST_TEST(s.split(a, false).total() == a);
    }
    const Amount big = 18000000000000000000ULL;
    BOOST_TEST(s.split(big, true).total() == big);
}

BOOST_AUTO_TEST_CASE(percentages_must_sum_to_100)
{
    // The 84/23/1 split sums to 108 and is refused.
    BOOST_CHECK_THROW(PaymentSplitter(84, 23, 1), std::invalid_argument);
    BOOST_CHECK_THROW(PaymentSplitter(50, 40, 5), std::invalid_argument);
    BOOST_CHECK_NO_THROW(PaymentSplitter(0, 100, 0));
    PaymentSplitter s(70, 20, 10);
    BOOST_TEST(s.ownerPct() == 70u);
    BOOST_TEST(s.poolPct() == 20u);
    BOOST_TEST(s.operatorPct() == 10u);
}

BOOST_AUTO_TEST_SUITE_END()
