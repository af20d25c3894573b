/**
 * @file test_main.cpp
 * @brief Boost.Test entry point for the pixelwar unit tests.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#define BOOST_TEST_MODULE pixelwar
#include <boost/test/unit_test.hpp>
