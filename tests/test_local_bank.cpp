/**
 * @file test_local_bank.cpp
 * @brief LocalBank accounting: transfers, reclaims, debits and forced failures.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "LocalBank.h"

BOOST_AUTO_TEST_SUITE(local_bank)

BOOST_AUTO_TEST_CASE(transfer_and_reclaim_keep_totals)
{
    LocalBank bank;
    BOOST_TEST(bank.transfer("a", 50));
    BOOST_TEST(bank.transfer("b", 30));
    BOOST_TEST(bank.totalTransferred() == 80u);
    BOOST_TEST(bank.transferCount() == 2u);

    BOOST_TEST(bank.reclaim("a", 50));
    BOOST_TEST(bank.balanceOf("a") == 0u);
    BOOST_TEST(bank.totalTransferred() == 30u);
    BOOST_TEST(bank.transferCount() == 1u);
    BOOST_TEST(!bank.transfer("", 10));
}

BOOST_AUTO_TEST_CASE(failing_recipient_refuses_until_cleared)
{
    LocalBank bank;
    bank.setFailing("a", true);
    BOOST_TEST(!bank.transfer("a", 5));
    BOOST_TEST(bank.balanceOf("a") == 0u);
    BOOST_TEST(bank.totalTransferred() == 0u);
    bank.setFailing("a", false);
    BOOST_TEST(bank.transfer("a", 5));
    BOOST_TEST(bank.balanceOf("a") == 5u);
}

BOOST_AUTO_TEST_CASE(debit_needs_sufficient_balance)
{
    LocalBank bank;
    BOOST_TEST(!bank.debit("a", 1));
    bank.deposit("a", 10);
    BOOST_TEST(!bank.debit("a", 11));
    BOOST_TEST(bank.debit("a", 10));
    BOOST_TEST(bank.balanceOf("a") == 0u);
    // Deposits are funding, not ledger transfers.
    BOOST_TEST(bank.totalTransferred() == 0u);
}

BOOST_AUTO_TEST_CASE(reclaim_of_spent_funds_recovers_only_the_balance)
{
    LocalBank bank;
    BOOST_TEST(bank.transfer("a", 50));
    BOOST_TEST(bank.debit("a", 30));

    BOOST_TEST(!bank.reclaim("a", 50));
    BOOST_TEST(bank.balanceOf("a") == 0u);
    // 20 came back; the 30 already spent is still counted as paid out.
    BOOST_TEST(bank.totalTransferred() == 30u);
    BOOST_TEST(bank.reclaimShortfall() == 30u);
}

BOOST_AUTO_TEST_SUITE_END()
