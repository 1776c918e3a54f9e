#pragma once
// Tree search over reasoning states
//
// BFS, DFS, beam and MCTS over a tree rooted at the problem statement.
// The node budget is a hard cap: expansion stops the moment the tree
// holds max_nodes nodes, and nodes at max_depth are never expanded.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <string>
#include <vector>

namespace cortex {

// Default successor states: "<parent> → step<depth>_<i>"
inline std::vector<std::string> default_expansion(const std::string& state, size_t depth,
                                                  size_t count) {
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(state + " → step" + std::to_string(depth + 1) + "_" + std::to_string(i));
    }
    return out;
}

class TreeSearch {
public:
    struct Limits {
        size_t max_nodes = 100;
        size_t max_depth = 10;
        size_t beam_width = 5;
        double exploration = 1.414;
    };

    TreeSearch(SearchTree& tree, const Evaluator& evaluator, const Expander& expander,
               Limits limits)
        : tree_(tree), evaluator_(evaluator), expander_(expander), limits_(limits)
    {
        if (limits_.max_nodes == 0) limits_.max_nodes = 1;
        if (limits_.beam_width == 0) limits_.beam_width = 1;
    }

    // Builds the tree from `problem`, returns the best path and its score
    SearchResult run(const std::string& problem) {
        tree_.nodes.clear();

        SearchNode root;
        root.id = generate_id("node");
        root.state = problem;
        root.score = evaluator_(problem);
        root.visits = 1;
        root.total_reward = root.score;
        tree_.nodes.push_back(std::move(root));

        size_t best = 0;
        double best_score = tree_.nodes[0].score;

        switch (tree_.algorithm) {
            case SearchAlgorithm::BFS: best = bfs(); break;
            case SearchAlgorithm::DFS: best = dfs(); break;
            case SearchAlgorithm::Beam: best = beam(); break;
            case SearchAlgorithm::MCTS: best = mcts(); break;
        }

        const SearchNode& node = tree_.nodes[best];
        if (tree_.algorithm == SearchAlgorithm::MCTS && best != 0 && node.visits > 0) {
            best_score = node.total_reward / node.visits;
        } else {
            best_score = node.score;
        }

        SearchResult result;
        result.tree_id = tree_.id;
        result.best_path = path_to(best);
        result.best_score = best_score;
        result.nodes_explored = tree_.nodes.size();
        return result;
    }

private:
    bool full() const { return tree_.nodes.size() >= limits_.max_nodes; }

    // Appends up to `count` children of `parent`, never past max_nodes
    std::vector<size_t> expand(size_t parent, size_t count) {
        std::vector<size_t> created;
        if (full() || tree_.nodes[parent].depth >= limits_.max_depth) return created;

        const std::string parent_state = tree_.nodes[parent].state;
        const size_t depth = tree_.nodes[parent].depth;

        auto states = expander_ ? expander_(parent_state, depth, count)
                                : default_expansion(parent_state, depth, count);
        if (states.size() > count) states.resize(count);

        for (auto& state : states) {
            if (full()) break;

            SearchNode child;
            child.id = generate_id("node");
            child.score = evaluator_(state);
            child.state = std::move(state);
            child.depth = depth + 1;
            child.parent = parent;

            size_t index = tree_.nodes.size();
            tree_.nodes.push_back(std::move(child));
            tree_.nodes[parent].children.push_back(index);
            created.push_back(index);
        }
        return created;
    }

    size_t better(size_t current, const std::vector<size_t>& candidates) const {
        for (size_t c : candidates) {
            if (tree_.nodes[c].score > tree_.nodes[current].score) current = c;
        }
        return current;
    }

    size_t bfs() {
        std::deque<size_t> queue{0};
        size_t best = 0;
        while (!queue.empty() && !full()) {
            size_t current = queue.front();
            queue.pop_front();
            auto children = expand(current, 3);
            best = better(best, children);
            queue.insert(queue.end(), children.begin(), children.end());
        }
        return best;
    }

    size_t dfs() {
        std::vector<size_t> stack{0};
        size_t best = 0;
        while (!stack.empty() && !full()) {
            size_t current = stack.back();
            stack.pop_back();
            auto children = expand(current, 2);
            best = better(best, children);
            stack.insert(stack.end(), children.begin(), children.end());
        }
        return best;
    }

    size_t beam() {
        std::vector<size_t> frontier{0};
        size_t best = 0;
        for (size_t depth = 0; depth < limits_.max_depth && !full(); ++depth) {
            std::vector<size_t> candidates;
            for (size_t node : frontier) {
                auto children = expand(node, limits_.beam_width);
                candidates.insert(candidates.end(), children.begin(), children.end());
            }
            if (candidates.empty()) break;

            std::stable_sort(candidates.begin(), candidates.end(), [this](size_t a, size_t b) {
                return tree_.nodes[a].score > tree_.nodes[b].score;
            });
            if (candidates.size() > limits_.beam_width) candidates.resize(limits_.beam_width);

            frontier = std::move(candidates);
            best = better(best, frontier);
        }
        return best;
    }

    // UCB1 selection, single-child expansion, evaluator rollout,
    // backpropagation to the root
    size_t mcts() {
        const double c = limits_.exploration;
        const size_t iterations = limits_.max_nodes * 2;

        for (size_t iter = 0; iter < iterations && !full(); ++iter) {
            size_t current = 0;
            while (!tree_.nodes[current].children.empty()) {
                const SearchNode& parent = tree_.nodes[current];
                double best_ucb = -std::numeric_limits<double>::infinity();
                size_t chosen = current;
                for (size_t child_index : parent.children) {
                    const SearchNode& child = tree_.nodes[child_index];
                    double exploitation = child.visits > 0 ? child.total_reward / child.visits : 0.0;
                    double exploration = c * std::sqrt(std::log(parent.visits + 1.0) /
                                                       (child.visits + 1.0));
                    if (exploitation + exploration > best_ucb) {
                        best_ucb = exploitation + exploration;
                        chosen = child_index;
                    }
                }
                if (chosen == current) break;
                current = chosen;
            }

            auto children = expand(current, 1);
            size_t leaf = children.empty() ? current : children.front();
            double reward = evaluator_(tree_.nodes[leaf].state);

            std::optional<size_t> node = leaf;
            while (node) {
                tree_.nodes[*node].visits++;
                tree_.nodes[*node].total_reward += reward;
                node = tree_.nodes[*node].parent;
            }
        }

        size_t best = 0;
        uint32_t best_visits = 0;
        for (size_t child : tree_.nodes[0].children) {
            if (tree_.nodes[child].visits > best_visits) {
                best_visits = tree_.nodes[child].visits;
                best = child;
            }
        }
        return best;
    }

    std::vector<std::string> path_to(size_t index) const {
        std::vector<std::string> path;
        std::optional<size_t> node = index;
        while (node) {
            path.push_back(tree_.nodes[*node].state);
            node = tree_.nodes[*node].parent;
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    SearchTree& tree_;
    const Evaluator& evaluator_;
    const Expander& expander_;
    Limits limits_;
};

} // namespace cortex
