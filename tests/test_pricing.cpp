/**
 * @file test_pricing.cpp
 * @brief PricingEngine: truncating escalation and construction checks.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "PricingEngine.h"

#include <limits>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(pricing)

BOOST_AUTO_TEST_CASE(ten_percent_escalation_truncates)
{
    PricingEngine p(110, 100);
    BOOST_TEST(p.nextPrice(100) == 110u);
    BOOST_TEST(p.nextPrice(110) == 121u);
    // 133.1 truncates to 133, and the series keeps compounding from the truncated value.
    BOOST_TEST(p.nextPrice(121) == 133u);
    BOOST_TEST(p.nextPrice(133) == 146u);
    BOOST_TEST(p.nextPrice(15) == 16u);
}

BOOST_AUTO_TEST_CASE(compounded_floor_stays_below_exact_series)
{
    PricingEngine p(110, 100);
    Amount price = 100;
    double exact = 100.0;
    for (int i = 0; i < 20; ++i) {
        Amount next = p.nextPrice(price);
        BOOST_TEST(next > price);
        price = next;
        exact *= 1.1;
    }
    BOOST_TEST(static_cast<double>(price) <= exact);
    BOOST_TEST(price == 655u);
}

BOOST_AUTO_TEST_CASE(rejects_bad_multipliers)
{
    BOOST_CHECK_THROW(PricingEngine(110, 0), std::invalid_argument);
    BOOST_CHECK_THROW(PricingEngine(100, 100), std::invalid_argument);
    BOOST_CHECK_THROW(PricingEngine(90, 100), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(overflow_is_reported)
{
    PricingEngine p(110, 100);
    BOOST_CHECK_THROW(p.nextPrice(std::numeric_limits<Amount>::max() - 1), std::overflow_error);
    // Large but representable: the 128-bit intermediate keeps it exact.
    BOOST_TEST(p.nextPrice(10000000000000000000ULL) == 11000000000000000000ULL);
}

BOOST_AUTO_TEST_SUITE_END()
