// -*- mode: c++ -*-

#ifndef SOLVER_H
#define SOLVER_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "grid.h"
#include "search.h"
#include "util.h"

// What the most recent search of a Solver did.
struct SolveStats {
    // Distinct cells discovered.
    size_t visited = 0;
    // Moves from entry to exit, or -1 if the exit wasn't reached.
    int depth = -1;
    bool found = false;
    // Total wall time spent searching, over all searches of the Solver.
    double search_s = 0;
};

// Computes and caches the shortest entry to exit path of one maze.
//
// The cache only tracks whether a result has been computed, not what
// the maze looked like at the time. Callers that modify the maze must
// call invalidate() before the next solve().
//
// Safe to share between threads; the maze must then be safe for
// concurrent reads. Only one search runs at a time. The Policy hooks
// run during the search and may call stats() or invalidate(), but not
// solve() or path_as_string().
template<class Maze,
         class Policy = BFSPolicy<Maze>>
class Solver {
public:
    explicit Solver(const Maze& maze)
        : maze_(maze) {
    }

    Solver(const Solver& other) = delete;
    Solver& operator=(const Solver& other) = delete;

    // Returns the moves from the entry to the exit. Empty if the exit
    // can't be reached, or if the entry is the exit.
    Path solve() {
        std::lock_guard<std::mutex> search_lock(search_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (path_) {
                return *path_;
            }
        }

        BreadthFirstSearch<Maze, Policy> bfs(maze_);
        double search_s = 0;
        Path path;
        {
            MeasureTime<> timer(&search_s);
            path = bfs.search();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        path_.reset(new Path(path));
        stats_.search_s += search_s;
        stats_.visited = bfs.visited();
        stats_.found = bfs.found();
        stats_.depth = bfs.found() ? bfs.depth_of(maze_.exit()) : -1;
        return path;
    }

    // The symbols of solve(), concatenated.
    std::string path_as_string() {
        std::string out;
        for (Direction dir : solve()) {
            out.push_back(direction_symbol(dir));
        }
        return out;
    }

    // Forgets the cached path. The next solve() searches again.
    void invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        path_.reset();
    }

    SolveStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    const Maze& maze_;
    // Null until a search has been run.
    std::unique_ptr<Path> path_;
    SolveStats stats_;
    // Held for the whole of solve(), so a search is never run twice.
    std::mutex search_mutex_;
    // Guards path_ and stats_.
    mutable std::mutex mutex_;
};

#endif
