// -*- mode: c++ -*-
//
// A breadth-first search for the shortest path through a maze.
//
// The maze is an unweighted graph: the nodes are cells, and there's
// an edge between two adjacent cells iff the wall between them is
// open. Every move costs one step, so the first time the search
// discovers a cell it has discovered it through a path with the
// fewest possible moves.
//
// - Start with a queue containing just the entry, and a visit map
//   where the entry is the root.
// - Pop cells off the queue in FIFO order. For each open neighbor of
//   the cell (in the order the maze reports them) that isn't in the
//   visit map yet, record the cell and the direction of the move
//   as the parent of the neighbor, then push the neighbor.
// - Once the exit is popped, follow the parent links back to the
//   root. The directions collected on the way, reversed, are the
//   path.
// - If the queue runs dry first, the exit can't be reached and the
//   path is empty.
//
// Since a cell enters the visit map (and the queue) only once, the
// search is O(cells + passages). When there are several shortest
// paths, the one returned is fixed by the order in which the maze
// enumerates neighbors.

#ifndef SEARCH_H
#define SEARCH_H

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <deque>
#include <unordered_map>

#include "grid.h"

// A default policy class, with hook implementations that do nothing.
template<class Maze>
struct BFSPolicy {
    // Called at the start of each new depth of the breadth-first
    // search.
    static void start_iteration(int depth) {
    }

    // Called for every cell on the solution that was found, starting
    // from the exit.
    static void trace(const Maze& maze, const Cell& cell, int depth) {
    }

    // Called once the search is over.
    static void finish(bool found, size_t visited) {
    }
};

// How a cell was first reached. Either the root of the search (the
// entry, which has no parent), or a move in direction dir() from
// parent().
class Visit {
public:
    static Visit root() {
        return Visit(true, Cell(), NORTH, 0);
    }

    static Visit from(const Cell& parent, Direction dir, int depth) {
        return Visit(false, parent, dir, depth);
    }

    bool is_root() const { return root_; }

    // May only be called on non-root visits.
    const Cell& parent() const {
        assert(!root_);
        return parent_;
    }
    Direction dir() const {
        assert(!root_);
        return dir_;
    }

    // Number of moves from the entry.
    int depth() const { return depth_; }

private:
    Visit(bool root, const Cell& parent, Direction dir, int depth)
        : root_(root), parent_(parent), dir_(dir), depth_(depth) {
    }

    bool root_;
    Cell parent_;
    Direction dir_;
    int depth_;
};

// A breadth first search driven by the template parameters.
//
// Template parameters.
//
// Maze: The graph to search. Must implement:
// - entry(), exit(): The Cells to search between.
// - open_neighbors(const Cell& cell): Returns a sequence of Neighbor
//   records for all cells that can be reached from cell in one
//   move. Must not modify the maze, and must always return the
//   neighbors of a given cell in the same order.
//
// Policy: Hook functions called at various point of the search
// process. See BFSPolicy for the set of hooks that should be
// defined.
template<class Maze,
         class Policy = BFSPolicy<Maze>>
class BreadthFirstSearch {
public:
    using VisitMap = std::unordered_map<Cell, Visit, CellHash>;

    explicit BreadthFirstSearch(const Maze& maze)
        : maze_(maze) {
    }

    // Execute a search from the entry to the exit of the maze. Returns
    // the moves of a shortest path, or an empty path if the exit can't
    // be reached.
    Path search() {
        const Cell entry = maze_.entry();
        const Cell exit = maze_.exit();

        visits_.clear();
        found_ = false;

        std::deque<Cell> todo;
        todo.push_back(entry);
        visits_.emplace(entry, Visit::root());

        int depth = -1;
        while (!todo.empty()) {
            Cell cell = todo.front();
            todo.pop_front();

            const Visit& visit = visits_.at(cell);
            if (visit.depth() != depth) {
                depth = visit.depth();
                Policy::start_iteration(depth);
            }

            if (cell == exit) {
                found_ = true;
                break;
            }

            for (const Neighbor& n : maze_.open_neighbors(cell)) {
                // First visit wins; that's what makes the path a
                // shortest one.
                if (visits_.count(n.cell)) {
                    continue;
                }
                visits_.emplace(n.cell, Visit::from(cell, n.dir, depth + 1));
                todo.push_back(n.cell);
            }
        }

        Policy::finish(found_, visits_.size());

        if (!found_) {
            return Path();
        }
        return trace_solution_path(exit);
    }

    // True iff the last search reached the exit.
    bool found() const { return found_; }

    // Number of distinct cells discovered by the last search.
    size_t visited() const { return visits_.size(); }

    // The number of moves from the entry to the given cell in the last
    // search, or -1 if the cell was never discovered.
    int depth_of(const Cell& cell) const {
        auto it = visits_.find(cell);
        if (it == visits_.end()) {
            return -1;
        }
        return it->second.depth();
    }

private:
    // Works backwards from the exit to the entry, calling
    // Policy::trace on each cell, and returns the moves in entry to
    // exit order.
    Path trace_solution_path(const Cell& exit) const {
        Path path;
        Cell target = exit;

        while (1) {
            const Visit& visit = visits_.at(target);
            Policy::trace(maze_, target, visit.depth());
            if (visit.is_root()) {
                break;
            }
            path.push_back(visit.dir());
            target = visit.parent();
        }

        std::reverse(path.begin(), path.end());
        return path;
    }

    const Maze& maze_;
    VisitMap visits_;
    bool found_ = false;
};

#endif
