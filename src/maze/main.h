// -*- mode: c++ -*-

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <string>
#include <vector>

#include "grid.h"
#include "maze/maze.h"
#include "search.h"
#include "solver.h"

static int failures = 0;

#define EXPECT_EQ(wanted, actual)                                       \
    do {                                                                \
        printf("Running %s\n", #actual);                                \
        auto tmp = actual;                                              \
        if (tmp != wanted) {                                            \
            fprintf(stderr, "Error: expected %s => %d, got %d\n", #actual, (int) (wanted), (int) tmp); \
            ++failures;                                                 \
        }                                                               \
    } while (0)

#define EXPECT_STR_EQ(wanted, actual)                                   \
    do {                                                                \
        printf("Running %s\n", #actual);                                \
        std::string tmp = actual;                                       \
        if (tmp != wanted) {                                            \
            fprintf(stderr, "Error: expected %s => \"%s\", got \"%s\"\n", #actual, std::string(wanted).c_str(), tmp.c_str()); \
            ++failures;                                                 \
        }                                                               \
    } while (0)

// Exit status for main().
static int test_result() {
    if (failures) {
        fprintf(stderr, "%d failures\n", failures);
        return 1;
    }
    printf("OK\n");
    return 0;
}

// Logs the progress of a search and the cells of the solution.
class VerboseSearch {
public:
    static void start_iteration(int depth) {
        printf("depth: %d\n", depth);
    }

    static void trace(const GridMaze& maze, const Cell& cell, int depth) {
        printf("Move %d: (%d, %d)\n", depth, cell.row, cell.col);
    }

    static void finish(bool found, size_t visited) {
        printf("%s, %zu cells visited\n", found ? "Win" : "No solution",
               visited);
    }
};

using VerboseSolver = Solver<GridMaze, VerboseSearch>;

// The number of moves from the entry to the exit, computed by
// relaxing distances until nothing changes. Doesn't share any code
// with the search. Returns -1 if the exit can't be reached.
static int flood_distance(const GridMaze& maze) {
    const int unknown = maze.rows() * maze.cols();
    std::vector<std::vector<int>> dist(maze.rows(),
                                       std::vector<int>(maze.cols(), unknown));
    dist[maze.entry().row][maze.entry().col] = 0;

    bool changed = true;
    while (changed) {
        changed = false;
        for (int r = 0; r < maze.rows(); ++r) {
            for (int c = 0; c < maze.cols(); ++c) {
                int d = dist[r][c];
                if (d == unknown) continue;
                if (r > 0 && !maze.has_wall(Cell(r, c), NORTH) &&
                    dist[r - 1][c] > d + 1) {
                    dist[r - 1][c] = d + 1; changed = true;
                }
                if (r < maze.rows() - 1 && !maze.has_wall(Cell(r, c), SOUTH) &&
                    dist[r + 1][c] > d + 1) {
                    dist[r + 1][c] = d + 1; changed = true;
                }
                if (c < maze.cols() - 1 && !maze.has_wall(Cell(r, c), EAST) &&
                    dist[r][c + 1] > d + 1) {
                    dist[r][c + 1] = d + 1; changed = true;
                }
                if (c > 0 && !maze.has_wall(Cell(r, c), WEST) &&
                    dist[r][c - 1] > d + 1) {
                    dist[r][c - 1] = d + 1; changed = true;
                }
            }
        }
    }

    int d = dist[maze.exit().row][maze.exit().col];
    return d == unknown ? -1 : d;
}

// Returns true iff following path from the entry only crosses open
// passages and ends at the exit.
static bool path_valid(const GridMaze& maze, const Path& path) {
    Cell at = maze.entry();
    for (Direction dir : path) {
        if (maze.has_wall(at, dir)) {
            fprintf(stderr, "Wall at (%d, %d) %c\n", at.row, at.col,
                    direction_symbol(dir));
            return false;
        }
        at = step(at, dir);
    }
    return at == maze.exit();
}

static std::string join_symbols(const Path& path) {
    std::string out;
    for (Direction dir : path) {
        out += direction_symbol(dir);
    }
    return out;
}

// Solves the maze with tracing, prints the solution, and checks the
// properties every solution must have. Returns the number of moves,
// or -1 if there's no solution.
static int search(const GridMaze& maze) {
    maze.print();

    VerboseSolver solver(maze);
    Path path = solver.solve();

    EXPECT_STR_EQ(join_symbols(path), solver.path_as_string());
    EXPECT_EQ(1, path_valid(maze, path) || path.empty());

    int wanted = flood_distance(maze);
    if (wanted < 0) {
        EXPECT_EQ(0, path.size());
        return -1;
    }
    EXPECT_EQ(wanted, path.size());
    EXPECT_EQ(1, path_valid(maze, path));

    maze.print(path);
    return path.size();
}
