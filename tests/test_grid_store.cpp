/**
 * @file test_grid_store.cpp
 * @brief GridStore: dimensions, defaults and bounds checking.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <boost/test/unit_test.hpp>

#include "GridStore.h"

#include <stdexcept>

BOOST_AUTO_TEST_SUITE(grid_store)

BOOST_AUTO_TEST_CASE(new_grid_is_unowned_at_initial_price)
{
    GridStore g(4, 3, 100);
    BOOST_TEST(g.width() == 4);
    BOOST_TEST(g.height() == 3);
    BOOST_TEST(g.size() == 12u);
    const Cell& c = g.get(3, 2);
    BOOST_TEST(!c.hasOwner());
    BOOST_TEST(c.price == 100u);
    BOOST_TEST(c.tag.empty());
    BOOST_TEST(c.lastUpdateCycle == 0u);
}

BOOST_AUTO_TEST_CASE(set_then_get_addresses_one_cell)
{
    GridStore g(4, 4, 100);
    Cell c;
    c.owner = "alice";
    c.price = 110;
    c.tag = "#FF0000";
    c.lastUpdateCycle = 1;
    g.set(1, 2, c);
    BOOST_TEST(g.get(1, 2).owner == "alice");
    BOOST_TEST(g.get(2, 1).owner.empty());
    BOOST_TEST(g.get(1, 2).price == 110u);
}

BOOST_AUTO_TEST_CASE(out_of_bounds_throws)
{
    GridStore g(4, 4, 100);
    BOOST_TEST(!g.inBounds(4, 0));
    BOOST_TEST(!g.inBounds(0, 4));
    BOOST_TEST(!g.inBounds(-1, 0));
    BOOST_TEST(g.inBounds(3, 3));
    BOOST_CHECK_THROW(g.get(4, 0), std::out_of_range);
    BOOST_CHECK_THROW(g.set(0, -1, Cell()), std::out_of_range);
    BOOST_CHECK_THROW(GridStore(0, 4, 100), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
