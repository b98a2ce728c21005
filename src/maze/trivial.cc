#include "main.h"

int main() {
    const char* drawing =
        "+-+-+"
        "|   |"
        "+ + +"
        "|   |"
        "+-+-+";

    GridMaze corners(2, 2, drawing);
    GridMaze maze(2, 2, Cell(1, 1), Cell(1, 1));
    maze.open_passage(Cell(1, 1), NORTH);
    maze.open_passage(Cell(1, 1), WEST);

    EXPECT_EQ(0, search(maze));

    // Entry and exit coincide: nothing to do, but that's a solution.
    Solver<GridMaze> solver(maze);
    EXPECT_EQ(0, solver.solve().size());
    EXPECT_STR_EQ("", solver.path_as_string());
    EXPECT_EQ(1, solver.stats().found);
    EXPECT_EQ(0, solver.stats().depth);
    EXPECT_EQ(1, solver.stats().visited);

    // Without markers the entry and exit are opposite corners.
    EXPECT_EQ(0, corners.entry().row);
    EXPECT_EQ(0, corners.entry().col);
    EXPECT_EQ(1, corners.exit().row);
    EXPECT_EQ(1, corners.exit().col);
    EXPECT_EQ(2, search(corners));

    return test_result();
}
