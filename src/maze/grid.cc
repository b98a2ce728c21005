#include <unordered_set>

#include "main.h"

int main() {
    EXPECT_EQ('N', direction_symbol(NORTH));
    EXPECT_EQ('E', direction_symbol(EAST));
    EXPECT_EQ('S', direction_symbol(SOUTH));
    EXPECT_EQ('W', direction_symbol(WEST));

    EXPECT_EQ(SOUTH, opposite(NORTH));
    EXPECT_EQ(WEST, opposite(EAST));
    EXPECT_EQ(NORTH, opposite(SOUTH));
    EXPECT_EQ(EAST, opposite(WEST));

    EXPECT_EQ(1, step(Cell(2, 2), NORTH) == Cell(1, 2));
    EXPECT_EQ(1, step(Cell(2, 2), EAST) == Cell(2, 3));
    EXPECT_EQ(1, step(Cell(2, 2), SOUTH) == Cell(3, 2));
    EXPECT_EQ(1, step(Cell(2, 2), WEST) == Cell(2, 1));

    EXPECT_EQ(1, Cell(3, 4).hash() == Cell(3, 4).hash());
    EXPECT_EQ(1, Cell(3, 4).hash() != Cell(4, 3).hash());
    EXPECT_EQ(1, Cell(0, 9) < Cell(1, 0));

    std::unordered_set<Cell, CellHash> cells;
    cells.insert(Cell(0, 0));
    cells.insert(Cell(0, 1));
    cells.insert(Cell(0, 0));
    EXPECT_EQ(2, cells.size());

    // A fresh maze is walled on all sides.
    GridMaze maze(3, 3, Cell(0, 0), Cell(2, 2));
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_EQ(0, maze.open_neighbors(Cell(r, c)).size());
        }
    }

    // Walls are shared with the neighbor.
    EXPECT_EQ(1, maze.open_passage(Cell(1, 1), NORTH));
    EXPECT_EQ(0, maze.has_wall(Cell(1, 1), NORTH));
    EXPECT_EQ(0, maze.has_wall(Cell(0, 1), SOUTH));
    EXPECT_EQ(1, maze.close_passage(Cell(0, 1), SOUTH));
    EXPECT_EQ(1, maze.has_wall(Cell(1, 1), NORTH));

    // The boundary stays closed.
    EXPECT_EQ(0, maze.open_passage(Cell(0, 0), NORTH));
    EXPECT_EQ(0, maze.open_passage(Cell(0, 0), WEST));
    EXPECT_EQ(0, maze.open_passage(Cell(2, 2), EAST));
    EXPECT_EQ(1, maze.has_wall(Cell(0, 0), NORTH));
    EXPECT_EQ(0, maze.in_bounds(Cell(-1, 0)));
    EXPECT_EQ(0, maze.in_bounds(Cell(0, 3)));
    EXPECT_EQ(1, maze.in_bounds(Cell(2, 2)));

    // Neighbors come out in NORTH, EAST, SOUTH, WEST order, whatever
    // order the passages were opened in.
    maze.open_passage(Cell(1, 1), WEST);
    maze.open_passage(Cell(1, 1), SOUTH);
    maze.open_passage(Cell(1, 1), EAST);
    maze.open_passage(Cell(1, 1), NORTH);
    std::vector<Neighbor> neighbors = maze.open_neighbors(Cell(1, 1));
    EXPECT_EQ(4, neighbors.size());
    const Direction order[] = { NORTH, EAST, SOUTH, WEST };
    for (size_t i = 0; i < neighbors.size(); ++i) {
        EXPECT_EQ(order[i], neighbors[i].dir);
        EXPECT_EQ(1, neighbors[i].cell == step(Cell(1, 1), order[i]));
    }

    std::vector<Neighbor> corner = maze.open_neighbors(Cell(0, 1));
    EXPECT_EQ(1, corner.size());
    EXPECT_EQ(SOUTH, corner[0].dir);

    // Drawing parser.
    const char* drawing =
        "+-+-+-+"
        "|  *| |"
        "+ +-+ +"
        "|  @  |"
        "+-+-+-+";
    GridMaze drawn(2, 3, drawing);
    EXPECT_EQ(2, drawn.rows());
    EXPECT_EQ(3, drawn.cols());
    EXPECT_EQ(1, drawn.entry() == Cell(1, 1));
    EXPECT_EQ(1, drawn.exit() == Cell(0, 1));
    EXPECT_EQ(0, drawn.has_wall(Cell(0, 0), EAST));
    EXPECT_EQ(1, drawn.has_wall(Cell(0, 1), EAST));
    EXPECT_EQ(0, drawn.has_wall(Cell(0, 0), SOUTH));
    EXPECT_EQ(1, drawn.has_wall(Cell(0, 1), SOUTH));
    EXPECT_EQ(0, drawn.has_wall(Cell(0, 2), SOUTH));
    EXPECT_EQ(0, drawn.has_wall(Cell(1, 1), EAST));
    EXPECT_EQ(0, drawn.has_wall(Cell(1, 0), EAST));
    EXPECT_EQ(3, search(drawn));

    Solver<GridMaze> solver(drawn);
    EXPECT_STR_EQ("WNE", solver.path_as_string());

    return test_result();
}
