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
    EXPECT_EQ(11, search(maze));

    Solver<GridMaze> solver(maze);
    EXPECT_STR_EQ("EEESWWWSEEE", solver.path_as_string());

    // Several shortest paths; neighbor order decides between them.
    const char* open =
        "+-+-+-+"
        "|@    |"
        "+ + + +"
        "|     |"
        "+ + + +"
        "|    *|"
        "+-+-+-+";

    GridMaze square(3, 3, open);
    EXPECT_EQ(4, search(square));
    Solver<GridMaze> square_solver(square);
    EXPECT_STR_EQ("EESS", square_solver.path_as_string());

    const char* reversed =
        "+-+-+-+"
        "|*    |"
        "+ + + +"
        "|     |"
        "+ + + +"
        "|    @|"
        "+-+-+-+";

    GridMaze back(3, 3, reversed);
    EXPECT_EQ(4, search(back));
    Solver<GridMaze> back_solver(back);
    EXPECT_STR_EQ("NNWW", back_solver.path_as_string());

    // A loop with a short and a long way around.
    const char* loop =
        "+-+-+-+-+"
        "|@      |"
        "+ +-+-+ +"
        "| |   | |"
        "+ +-+-+ +"
        "|      *|"
        "+-+-+-+-+";

    GridMaze ring(3, 4, loop);
    EXPECT_EQ(5, search(ring));

    return test_result();
}
