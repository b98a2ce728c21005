// -*- mode: c++ -*-

#ifndef GRID_H
#define GRID_H

#include <cstdint>
#include <vector>

#include <city.h>

// The four cardinal directions. The numeric values double as indexes
// into the direction tables below, so the order matters.
enum Direction {
    NORTH, EAST, SOUTH, WEST,
};

// Single-character display symbol of a direction.
inline char direction_symbol(Direction dir) {
    static const char symbols[] = { 'N', 'E', 'S', 'W' };
    return symbols[dir];
}

inline Direction opposite(Direction dir) {
    return Direction((dir + 2) & 3);
}

// A grid position. Rows grow southward, columns grow eastward.
struct Cell {
    Cell() : row(0), col(0) {
    }

    Cell(int32_t r, int32_t c) : row(r), col(c) {
    }

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const {
        return !(*this == other);
    }
    bool operator<(const Cell& other) const {
        if (row != other.row) {
            return row < other.row;
        }
        return col < other.col;
    }

    // Computes a hashcode for this cell.
    uint64_t hash() const {
        int32_t packed[2] = { row, col };
        return CityHash64((const char*) packed, sizeof(packed));
    }

    int32_t row;
    int32_t col;
};

// Hash functor for using Cells as unordered container keys.
struct CellHash {
    size_t operator()(const Cell& cell) const {
        return cell.hash();
    }
};

// Returns the cell adjacent to _cell_ in direction _dir_. No bounds
// checking; that's up to the maze.
inline Cell step(const Cell& cell, Direction dir) {
    static const int32_t row_deltas[] = { -1, 0, 1, 0 };
    static const int32_t col_deltas[] = { 0, 1, 0, -1 };
    return Cell(cell.row + row_deltas[dir], cell.col + col_deltas[dir]);
}

// An adjacent cell reachable through an open passage, together with
// the direction of travel from the source cell.
struct Neighbor {
    Cell cell;
    Direction dir;
};

// A sequence of moves from the entry to the exit. Empty if there is
// no path (or no moves are needed).
using Path = std::vector<Direction>;

#endif // GRID_H
