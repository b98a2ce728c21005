#include "main.h"

int main() {
    const char* good =
        "+-+-+"
        "|@  |"
        "+ +-+"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(0, GridMaze::check_drawing(2, 2, good));

    // Too short: the drawing ends in the middle of the first row.
    EXPECT_EQ(1, GridMaze::check_drawing(2, 2, "+-+-+|@  |"));
    // Right length for a different maze.
    EXPECT_EQ(1, GridMaze::check_drawing(2, 3, good));

    const char* bad_wall =
        "+-+-+"
        "|@x |"
        "+ +-+"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(1, GridMaze::check_drawing(2, 2, bad_wall));

    const char* gap =
        "+-+-+"
        "|@   "
        "+ +-+"
        "|  *|"
        "+- -+";
    EXPECT_EQ(2, GridMaze::check_drawing(2, 2, gap));

    const char* two_exits =
        "+-+-+"
        "|*  |"
        "+ + +"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(1, GridMaze::check_drawing(2, 2, two_exits));

    const char* two_entries =
        "+-+-+"
        "|@ @|"
        "+ + +"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(1, GridMaze::check_drawing(2, 2, two_entries));

    const char* bad_cell =
        "+-+-+"
        "|@ #|"
        "+ + +"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(1, GridMaze::check_drawing(2, 2, bad_cell));

    // Everything at once: two exits, a stray character in a wall and
    // an open east boundary.
    const char* mess =
        "+-+-+"
        "|*x  "
        "+ + +"
        "|  *|"
        "+-+-+";
    EXPECT_EQ(3, GridMaze::check_drawing(2, 2, mess));

    // Any of [|-+] is a wall, wherever it is.
    const char* mixed =
        "+++-+"
        "-@+ |"
        "+ |-+"
        "|  *-"
        "+-|-+";
    EXPECT_EQ(0, GridMaze::check_drawing(2, 2, mixed));
    GridMaze maze(2, 2, mixed);
    EXPECT_EQ(1, maze.has_wall(Cell(0, 0), EAST));
    EXPECT_EQ(0, maze.has_wall(Cell(0, 0), SOUTH));
    EXPECT_EQ(1, maze.has_wall(Cell(0, 1), SOUTH));
    EXPECT_EQ(0, maze.has_wall(Cell(1, 0), EAST));
    EXPECT_EQ(2, search(maze));

    return test_result();
}
