#include "main.h"

class StatsSearch;
using StatsSolver = Solver<GridMaze, StatsSearch>;

static StatsSolver* current = nullptr;
static int iterations = 0;
static int traced = 0;
static int finished = 0;

// Reads the solver's statistics from inside the search.
class StatsSearch {
public:
    static void start_iteration(int depth) {
        EXPECT_EQ(-1, current->stats().depth);
        ++iterations;
    }

    static void trace(const GridMaze& maze, const Cell& cell, int depth) {
        current->stats();
        ++traced;
    }

    static void finish(bool found, size_t visited) {
        EXPECT_EQ(0, current->stats().visited);
        ++finished;
    }
};

int main() {
    const char* serpentine =
        "+-+-+-+-+"
        "|@      |"
        "+-+-+-+ +"
        "|       |"
        "+ +-+-+-+"
        "|      *|"
        "+-+-+-+-+";

    GridMaze maze(3, 4, serpentine);
    StatsSolver solver(maze);
    current = &solver;

    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());
    EXPECT_EQ(12, iterations);
    EXPECT_EQ(12, traced);
    EXPECT_EQ(1, finished);
    EXPECT_EQ(11, solver.stats().depth);

    // Cached; no hooks run.
    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());
    EXPECT_EQ(1, finished);

    return test_result();
}
