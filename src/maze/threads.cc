#include <thread>

#include "main.h"

int main() {
    const char* drawing =
        "+-+-+-+-+-+-+"
        "|@    |     |"
        "+-+-+ + +-+ +"
        "|     |   | |"
        "+ +-+-+-+ + +"
        "|         | |"
        "+-+ + +-+-+ +"
        "|   |      *|"
        "+-+-+-+-+-+-+";

    GridMaze maze(4, 6, drawing);
    int moves = search(maze);
    EXPECT_EQ(1, moves > 0);

    Solver<GridMaze> reference(maze);
    const std::string wanted = reference.path_as_string();

    // One solver shared by all threads, and one per thread.
    Solver<GridMaze> shared(maze);
    const int kThreads = 8;
    std::vector<std::string> shared_results(kThreads);
    std::vector<std::string> own_results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&maze, &shared, &shared_results,
                              &own_results, i] {
            for (int j = 0; j < 100; ++j) {
                if (j % 10 == 0) {
                    shared.invalidate();
                }
                shared_results[i] = shared.path_as_string();
            }
            Solver<GridMaze> own(maze);
            own_results[i] = own.path_as_string();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_STR_EQ(wanted, shared_results[i]);
        EXPECT_STR_EQ(wanted, own_results[i]);
    }
    EXPECT_EQ(moves, wanted.size());

    return test_result();
}
