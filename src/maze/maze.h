// -*- mode: c++ -*-

#ifndef MAZE_MAZE_H
#define MAZE_MAZE_H

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

#include "grid.h"

// A rectangular grid of cells, with a wall on each side of each cell
// that's either open or closed. The wall between two adjacent cells
// is shared, so opening it from either side opens it for both. The
// outer boundary is always closed.
//
// open_neighbors() reports neighbors in NORTH, EAST, SOUTH, WEST
// order, which is what fixes the choice between equally short paths.
class GridMaze {
public:
    // Constructs a fully walled maze.
    GridMaze(int rows, int cols, const Cell& entry, const Cell& exit)
        : rows_(rows), cols_(cols),
          walls_(rows * cols, kAllWalls),
          entry_(entry), exit_(exit) {
        assert(rows > 0 && cols > 0);
        check_cell(entry, "entry");
        check_cell(exit, "exit");
    }

    // Constructs a maze from a drawing of (2*rows+1) lines of
    // (2*cols+1) characters each, concatenated. Cell (r, c) is drawn
    // at line 2*r+1, column 2*c+1, and the walls around it at the
    // adjacent positions. [ ] in a wall position is an open passage,
    // [|-+] are walls. [@] marks the entry, [*] the exit; they
    // default to the top left and the bottom right corner.
    //
    //   "+-+-+"
    //   "|@  |"
    //   "+ +-+"
    //   "|  *|"
    //   "+-+-+"
    //
    // A drawing that check_drawing() rejects leaves the maze fully
    // walled.
    GridMaze(int rows, int cols, const char* drawing)
        : GridMaze(rows, cols, Cell(0, 0), Cell(rows - 1, cols - 1)) {
        int problems = check_drawing(rows, cols, drawing);
        assert(problems == 0);
        if (problems) {
            return;
        }

        const int w = 2 * cols + 1;
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                Cell cell(r, c);
                int center = (2 * r + 1) * w + 2 * c + 1;
                if (drawing[center] == '@') {
                    entry_ = cell;
                } else if (drawing[center] == '*') {
                    exit_ = cell;
                }

                // Only look east and south; the other two sides are
                // covered by the neighbors.
                if (c + 1 < cols && drawing[center + 1] == ' ') {
                    open_passage(cell, EAST);
                }
                if (r + 1 < rows && drawing[center + w] == ' ') {
                    open_passage(cell, SOUTH);
                }
            }
        }
    }

    // Reports every problem with a drawing to stderr, and returns the
    // number of problems found.
    static int check_drawing(int rows, int cols, const char* drawing) {
        const int w = 2 * cols + 1;
        const int h = 2 * rows + 1;
        if (strlen(drawing) != size_t(w * h)) {
            fprintf(stderr, "Expected a %dx%d drawing, got %zu characters\n",
                    h, w, strlen(drawing));
            return 1;
        }

        int problems = 0;
        int entries = 0;
        int exits = 0;
        for (int line = 0; line < h; ++line) {
            for (int col = 0; col < w; ++col) {
                const char c = drawing[line * w + col];
                if ((line & 1) && (col & 1)) {
                    if (c == '@') {
                        ++entries;
                    } else if (c == '*') {
                        ++exits;
                    } else if (c != ' ') {
                        fprintf(stderr, "Unexpected '%c' in cell (%d, %d)\n",
                                c, line / 2, col / 2);
                        ++problems;
                    }
                    continue;
                }

                bool boundary = line == 0 || col == 0 ||
                    line == h - 1 || col == w - 1;
                bool wall = c == '|' || c == '-' || c == '+';
                if (boundary && !wall) {
                    fprintf(stderr, "Gap '%c' in the boundary at line %d, "
                            "column %d\n", c, line, col);
                    ++problems;
                } else if (!wall && c != ' ') {
                    fprintf(stderr, "Unexpected '%c' in a wall at line %d, "
                            "column %d\n", c, line, col);
                    ++problems;
                }
            }
        }

        if (entries > 1) {
            fprintf(stderr, "Expected at most one entry, got %d\n", entries);
            ++problems;
        }
        if (exits > 1) {
            fprintf(stderr, "Expected at most one exit, got %d\n", exits);
            ++problems;
        }
        return problems;
    }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    Cell entry() const { return entry_; }
    Cell exit() const { return exit_; }

    bool in_bounds(const Cell& cell) const {
        return cell.row >= 0 && cell.col >= 0 &&
            cell.row < rows_ && cell.col < cols_;
    }

    // Cells outside the maze are walled on all sides.
    bool has_wall(const Cell& cell, Direction dir) const {
        if (!in_bounds(cell)) {
            check_cell(cell, "cell");
            return true;
        }
        return walls_[index(cell)] & (1 << dir);
    }

    // Removes the wall on the dir side of cell. Returns false (and
    // leaves the maze unchanged) if that side is the outer boundary.
    bool open_passage(const Cell& cell, Direction dir) {
        return set_wall(cell, dir, false);
    }

    // Puts a wall back on the dir side of cell. Returns false if that
    // side is the outer boundary, which is always walled.
    bool close_passage(const Cell& cell, Direction dir) {
        return set_wall(cell, dir, true);
    }

    // The cells that can be reached from cell in one move, in NORTH,
    // EAST, SOUTH, WEST order.
    std::vector<Neighbor> open_neighbors(const Cell& cell) const {
        static const Direction dirs[] = {
            NORTH, EAST, SOUTH, WEST,
        };
        std::vector<Neighbor> neighbors;
        for (Direction dir : dirs) {
            if (!has_wall(cell, dir)) {
                neighbors.push_back(Neighbor { step(cell, dir), dir });
            }
        }
        return neighbors;
    }

    // Prints the maze in the same format the drawing constructor
    // accepts, with the cells along path (starting from the entry)
    // marked with [o].
    void print(const Path& path = Path()) const {
        std::vector<bool> on_path(rows_ * cols_, false);
        Cell at = entry_;
        for (Direction dir : path) {
            at = step(at, dir);
            if (!in_bounds(at)) {
                break;
            }
            on_path[index(at)] = true;
        }

        for (int line = 0; line < 2 * rows_ + 1; ++line) {
            for (int col = 0; col < 2 * cols_ + 1; ++col) {
                printf("%c", draw_at(line, col, on_path));
            }
            printf("\n");
        }
        printf("\n");
    }

private:
    enum : uint8_t { kAllWalls = 0xf };

    int index(const Cell& cell) const {
        return cell.row * cols_ + cell.col;
    }

    void check_cell(const Cell& cell, const char* what) const {
        if (!in_bounds(cell)) {
            fprintf(stderr, "%s (%d, %d) outside of %dx%d maze\n",
                    what, cell.row, cell.col, rows_, cols_);
        }
        assert(in_bounds(cell));
    }

    bool set_wall(const Cell& cell, Direction dir, bool wall) {
        check_cell(cell, "cell");
        Cell other = step(cell, dir);
        if (!in_bounds(cell) || !in_bounds(other)) {
            return false;
        }
        set_bit(cell, dir, wall);
        set_bit(other, opposite(dir), wall);
        return true;
    }

    void set_bit(const Cell& cell, Direction dir, bool wall) {
        if (wall) {
            walls_[index(cell)] |= 1 << dir;
        } else {
            walls_[index(cell)] &= ~(1 << dir);
        }
    }

    // The character at the given position of the drawing.
    char draw_at(int line, int col, const std::vector<bool>& on_path) const {
        bool odd_line = line & 1;
        bool odd_col = col & 1;
        if (!odd_line && !odd_col) {
            return '+';
        }
        if (odd_line && odd_col) {
            Cell cell(line / 2, col / 2);
            if (cell == entry_) {
                return '@';
            }
            if (cell == exit_) {
                return '*';
            }
            return on_path[index(cell)] ? 'o' : ' ';
        }
        if (odd_line) {
            // Vertical wall west of cell (line / 2, col / 2).
            Cell cell(line / 2, std::min(col / 2, cols_ - 1));
            Direction dir = col / 2 < cols_ ? WEST : EAST;
            return has_wall(cell, dir) ? '|' : ' ';
        }
        // Horizontal wall north of cell (line / 2, col / 2).
        Cell cell(std::min(line / 2, rows_ - 1), col / 2);
        Direction dir = line / 2 < rows_ ? NORTH : SOUTH;
        return has_wall(cell, dir) ? '-' : ' ';
    }

    int rows_;
    int cols_;
    // One bit per side of each cell, indexed by Direction. A set bit
    // is a wall.
    std::vector<uint8_t> walls_;
    Cell entry_;
    Cell exit_;
};

#endif
