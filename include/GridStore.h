/**
 * @file GridStore.h
 * @brief Declares GridStore, the fixed-size flattened storage of per-cell ledger state.
 *
 * GridStore has no locking and no rules of its own; PixelLedger owns it and serializes access.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <vector>

/**
 * @class GridStore
 * @brief width x height cells stored row-major.
 */
class GridStore {
public:
    /** @brief Construct a grid of @p width x @p height cells, each priced at @p initialPrice. */
    GridStore(int width, int height, Amount initialPrice);

    /** @brief Grid width in cells. */
    int width() const { return w; }
    /** @brief Grid height in cells. */
    int height() const { return h; }
    /** @brief Total number of cells. */
    size_t size() const { return cells.size(); }
    /** @brief Check if coordinates are within the grid. */
    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }

    /** @brief The cell at (x,y). Throws std::out_of_range outside the grid. */
    const Cell& get(int x, int y) const;
    /** @brief Replace the cell at (x,y). Throws std::out_of_range outside the grid. */
    void set(int x, int y, const Cell& c);

private:
    /** @brief Flattened index of (x,y); throws when out of bounds. */
    size_t index(int x, int y) const;

    int w, h;               /**< grid dimensions */
    std::vector<Cell> cells; /**< flattened grid storage of size w*h */
};
