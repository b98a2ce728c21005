#include "main.h"

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
    VerboseSolver solver(maze);

    EXPECT_EQ(0, solver.stats().visited);
    EXPECT_EQ(-1, solver.stats().depth);

    Path first = solver.solve();
    Path second = solver.solve();
    EXPECT_EQ(1, first == second);
    EXPECT_STR_EQ(join_symbols(first), solver.path_as_string());
    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());

    SolveStats stats = solver.stats();
    EXPECT_EQ(1, stats.found);
    EXPECT_EQ(11, stats.depth);
    EXPECT_EQ(12, stats.visited);
    EXPECT_EQ(1, stats.search_s >= 0);

    // Invalidating an unchanged maze gives the same answer back.
    solver.invalidate();
    EXPECT_EQ(1, first == solver.solve());

    // Invalidating twice in a row is fine.
    solver.invalidate();
    solver.invalidate();

    // Open a shortcut. The cached path isn't recomputed until the
    // cache is invalidated.
    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());
    EXPECT_EQ(1, maze.open_passage(Cell(0, 0), SOUTH));
    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());
    solver.invalidate();
    EXPECT_STR_EQ("SSEEE", solver.path_as_string());
    EXPECT_EQ(5, solver.stats().depth);
    EXPECT_EQ(5, search(maze));

    // Cut the maze in two.
    EXPECT_EQ(1, maze.close_passage(Cell(1, 0), SOUTH));
    solver.invalidate();
    EXPECT_STR_EQ("", solver.path_as_string());
    EXPECT_EQ(0, solver.stats().found);
    EXPECT_EQ(-1, search(maze));

    // And back to the start.
    EXPECT_EQ(1, maze.close_passage(Cell(0, 0), SOUTH));
    EXPECT_EQ(1, maze.open_passage(Cell(1, 0), SOUTH));
    solver.invalidate();
    EXPECT_EQ(1, first == solver.solve());

    return test_result();
}
