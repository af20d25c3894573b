/**
 * @file GridStore.cpp
 * @brief GridStore implementation: bounds-checked access to the flattened cell vector.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GridStore.h"

#include <stdexcept>
#include <string>

/** @copydoc GridStore::GridStore */
GridStore::GridStore(int width, int height, Amount initialPrice)
    : w(width), h(height) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("GridStore: dimensions must be positive");
    Cell blank;
    blank.price = initialPrice;
    cells.assign(static_cast<size_t>(width) * static_cast<size_t>(height), blank);
}

size_t GridStore::index(int x, int y) const {
    if (!inBounds(x, y)) {
        throw std::out_of_range("GridStore: (" + std::to_string(x) + "," + std::to_string(y) +
                                ") outside " + std::to_string(w) + "x" + std::to_string(h));
    }
    return static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x);
}

/** @copydoc GridStore::get */
const Cell& GridStore::get(int x, int y) const {
    return cells[index(x, y)];
}

/** @copydoc GridStore::set */
void GridStore::set(int x, int y, const Cell& c) {
    cells[index(x, y)] = c;
}
