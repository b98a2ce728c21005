#include "main.h"

int main() {
    // The two right hand cells are walled off from the rest.
    const char* partition =
        "+-+-+-+"
        "|@  | |"
        "+ +-+ +"
        "|   |*|"
        "+-+-+-+";

    GridMaze maze(2, 3, partition);
    EXPECT_EQ(-1, search(maze));

    Solver<GridMaze> solver(maze);
    EXPECT_EQ(0, solver.solve().size());
    EXPECT_STR_EQ("", solver.path_as_string());

    SolveStats stats = solver.stats();
    EXPECT_EQ(0, stats.found);
    EXPECT_EQ(-1, stats.depth);
    EXPECT_EQ(4, stats.visited);

    // No passages at all.
    GridMaze walled(3, 3, Cell(0, 0), Cell(2, 2));
    Solver<GridMaze> walled_solver(walled);
    EXPECT_STR_EQ("", walled_solver.path_as_string());
    EXPECT_EQ(1, walled_solver.stats().visited);

    return test_result();
}
