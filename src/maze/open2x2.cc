#include "main.h"

int main() {
    const char* drawing =
        "+-+-+"
        "|@  |"
        "+ + +"
        "|  *|"
        "+-+-+";

    GridMaze maze(2, 2, drawing);

    EXPECT_EQ(2, search(maze));

    // East is reported before South, so the path through (0, 1)
    // is discovered first.
    Solver<GridMaze> solver(maze);
    EXPECT_STR_EQ("ES", solver.path_as_string());

    // The same maze built by opening walls one at a time.
    GridMaze carved(2, 2, Cell(0, 0), Cell(1, 1));
    EXPECT_EQ(1, carved.open_passage(Cell(0, 0), EAST));
    EXPECT_EQ(1, carved.open_passage(Cell(0, 0), SOUTH));
    EXPECT_EQ(1, carved.open_passage(Cell(0, 1), SOUTH));
    EXPECT_EQ(1, carved.open_passage(Cell(1, 0), EAST));

    for (int i = 0; i < 3; ++i) {
        Solver<GridMaze> again(carved);
        EXPECT_STR_EQ("ES", again.path_as_string());
    }

    return test_result();
}
