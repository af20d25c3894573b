/**
 * @file test_config.cpp
 * @brief LedgerConfig validation plus environment and flag overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "LedgerConfig.h"

#include <cstdlib>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(config)

BOOST_AUTO_TEST_CASE(defaults_are_valid)
{
    LedgerConfig cfg;
    BOOST_CHECK_NO_THROW(cfg.validate());
    BOOST_TEST(cfg.ownerPct == 84u);
    BOOST_TEST(cfg.poolPct == 15u);
    BOOST_TEST(cfg.operatorPct == 1u);
    BOOST_TEST(cfg.initialPrice == 100000000000000ULL);
    BOOST_TEST(cfg.describe().find("split=84/15/1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(split_must_sum_to_one_hundred)
{
    LedgerConfig cfg;
    cfg.poolPct = 23;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(bad_shapes_and_prices_are_rejected)
{
    LedgerConfig cfg;
    cfg.width = 0;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    cfg = LedgerConfig();
    cfg.height = LedgerConfig::MaxSide + 1;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    cfg = LedgerConfig();
    cfg.initialPrice = 0;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    cfg = LedgerConfig();
    cfg.priceNumerator = 100;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    // 5 * 110 / 100 floors back to 5.
    cfg = LedgerConfig();
    cfg.initialPrice = 5;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    cfg = LedgerConfig();
    cfg.inactivityWindow = 0;
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);

    cfg = LedgerConfig();
    cfg.operatorId.clear();
    BOOST_CHECK_THROW(cfg.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(flags_accept_both_forms_and_skip_unknown)
{
    char prog[] = "pixelwar";
    char a1[] = "--width";
    char a2[] = "8";
    char a3[] = "--height=6";
    char a4[] = "--bidders";
    char a5[] = "20";
    char a6[] = "--window=120";
    char a7[] = "--operator=house";
    char a8[] = "--initial-price";
    char a9[] = "abc";
    char* argv[] = {prog, a1, a2, a3, a4, a5, a6, a7, a8, a9};

    LedgerConfig cfg;
    cfg.applyArgs(10, argv);
    BOOST_TEST(cfg.width == 8);
    BOOST_TEST(cfg.height == 6);
    BOOST_TEST(cfg.inactivityWindow == 120);
    BOOST_TEST(cfg.operatorId == "house");
    BOOST_TEST(cfg.initialPrice == 100000000000000ULL);
}

BOOST_AUTO_TEST_CASE(environment_overrides_fields)
{
    ::setenv("PIXELWAR_WIDTH", "16", 1);
    ::setenv("PIXELWAR_POOL_PCT", "14", 1);
    ::setenv("PIXELWAR_OPERATOR_PCT", "2", 1);
    ::setenv("PIXELWAR_HEIGHT", "-3", 1);
    LedgerConfig cfg;
    cfg.applyEnv();
    ::unsetenv("PIXELWAR_WIDTH");
    ::unsetenv("PIXELWAR_POOL_PCT");
    ::unsetenv("PIXELWAR_OPERATOR_PCT");
    ::unsetenv("PIXELWAR_HEIGHT");

    BOOST_TEST(cfg.width == 16);
    BOOST_TEST(cfg.height == 32);
    BOOST_TEST(cfg.poolPct == 14u);
    BOOST_TEST(cfg.operatorPct == 2u);
    BOOST_CHECK_NO_THROW(cfg.validate());
}

BOOST_AUTO_TEST_CASE(parse_amount_rejects_junk)
{
    Amount v = 7;
    BOOST_TEST(parseAmount("12345", v));
    BOOST_TEST(v == 12345u);
    BOOST_TEST(parseAmount("18446744073709551615", v));
    BOOST_TEST(v == 18446744073709551615ULL);
    BOOST_TEST(!parseAmount("18446744073709551616", v));
    BOOST_TEST(!parseAmount("", v));
    BOOST_TEST(!parseAmount(nullptr, v));
    BOOST_TEST(!parseAmount("-1", v));
    BOOST_TEST(!parseAmount("12x", v));
}

BOOST_AUTO_TEST_SUITE_END()
