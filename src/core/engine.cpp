#include "mine_prob/engine.hpp"
#include "mine_prob/constraint.hpp"
#include "mine_prob/enumerator.hpp"
#include "mine_prob/errors.hpp"
#include "mine_prob/group.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

namespace mine_prob {

ProbabilityMap Engine::compute(const BoardView& board, int mines_remaining, int per_cell) {
    return solve(board, mines_remaining, per_cell).probabilities;
}

ProbabilityReport Engine::solve(const BoardView& board, int mines_remaining, int per_cell) {
    if (mines_remaining < 0) {
        throw std::invalid_argument("mines_remaining must be non-negative: " +
                                    std::to_string(mines_remaining));
    }
    if (per_cell < 1) {
        throw std::invalid_argument("per_cell must be at least 1: " + std::to_string(per_cell));
    }

    stats_ = EngineStats{};
    CombinatoricsCache cache;

    // 未確定セルを集め、数字があるかを確認する
    std::vector<Coord> unknown;
    int64_t returned_flags = 0;
    bool has_numbers = false;
    for (const auto& coord : board.all_coords()) {
        auto contents = board.cell_contents(coord);
        switch (classify(contents, ignore_flags_)) {
            case CellRole::Unknown:
                unknown.push_back(coord);
                // 旗を無視する場合、その地雷数は残り地雷数に戻す
                if (ignore_flags_) returned_flags += pinned_mines(contents, false);
                break;
            case CellRole::Number:
                if (std::get<Num>(contents).value > 0) has_numbers = true;
                break;
            case CellRole::Pinned:
                break;
        }
    }
    std::sort(unknown.begin(), unknown.end());

    // 未確定セルに入りきらない地雷数はここで弾く（組合せ表を作る前に）
    int64_t total_mines = static_cast<int64_t>(mines_remaining) + returned_flags;
    int64_t capacity = static_cast<int64_t>(unknown.size()) * per_cell;
    if (total_mines > capacity) {
        throw NoSolutionError(std::to_string(total_mines) + " mines do not fit in " +
                              std::to_string(unknown.size()) + " unclicked cells");
    }
    if (total_mines > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Too many mines: " + std::to_string(total_mines));
    }
    int mines = static_cast<int>(total_mines);

    if (!has_numbers) {
        return solve_uniform(unknown, mines, per_cell, cache);
    }

    auto constraints = extract_constraints(board, per_cell, ignore_flags_);
    if (constraints.empty()) {
        return solve_uniform(unknown, mines, per_cell, cache);
    }

    auto layout = find_groups(constraints, per_cell);
    stats_.constraint_count = constraints.size();
    stats_.group_count = layout.groups.size();
    stats_.edge_cell_count = layout.edge_cell_count;
    stats_.outer_cell_count = unknown.size() - layout.edge_cell_count;

    if (verbose_) {
        std::cerr << "% [verbose] " << constraints.size() << " number constraints, "
                  << layout.groups.size() << " groups, " << layout.edge_cell_count
                  << " edge cells, " << stats_.outer_cell_count << " outer cells, "
                  << mines << " mines remaining\n";
    }

    EnumerationBudget budget;
    budget.max_configurations = max_configurations_;
    budget.time_limit = time_limit_;
    budget.stop_flag = &stopped_;

    ConfigEnumerator enumerator(constraints, layout, budget);
    ProbabilityCombiner combiner(layout, per_cell, mines, static_cast<int>(unknown.size()),
                                 cache, tolerance_);
    Configuration cfg;
    try {
        while (enumerator.next(cfg)) {
            combiner.add(cfg);
        }
    } catch (const SolverTimeoutError& e) {
        if (verbose_) {
            std::cerr << "% [verbose] enumeration stopped after "
                      << enumerator.stats().configuration_count << " configurations: "
                      << e.what() << "\n";
        }
        throw;
    }

    const auto& enum_stats = enumerator.stats();
    stats_.branch_count = enum_stats.branch_count;
    stats_.dead_end_count = enum_stats.dead_end_count;
    stats_.configuration_count = enum_stats.configuration_count;

    if (verbose_) {
        std::cerr << "% [verbose] enumeration done: " << enum_stats.configuration_count
                  << " configurations, " << enum_stats.branch_count << " branches, "
                  << enum_stats.dead_end_count << " dead ends\n";
    }

    std::set<Coord> edge;
    for (const auto& group : layout.groups) {
        edge.insert(group.coords.begin(), group.coords.end());
    }
    std::vector<Coord> outer;
    for (const auto& coord : unknown) {
        if (edge.count(coord) == 0) outer.push_back(coord);
    }

    auto report = combiner.finish(outer);
    stats_.combinatorics_rows = cache.table_rows();
    return report;
}

ProbabilityReport Engine::solve_uniform(const std::vector<Coord>& unknown, int mines,
                                        int per_cell, CombinatoricsCache& cache) {
    stats_.used_uniform_fallback = true;
    stats_.outer_cell_count = unknown.size();
    if (verbose_) {
        std::cerr << "% [verbose] no revealed numbers: uniform distribution over "
                  << unknown.size() << " cells\n";
    }

    ProbabilityReport report;
    report.uniform = true;
    report.outer_cell_count = unknown.size();
    report.outer_mines = mines;

    // solve() で容量は確認済み（空の盤面なら mines == 0）
    if (unknown.empty()) {
        return report;
    }

    int n = static_cast<int>(unknown.size());
    double p = unsafe_probability(n, mines, per_cell, cache);
    for (const auto& coord : unknown) {
        report.probabilities[coord] = p;
    }
    report.outer_probability = p;
    return report;
}

ProbabilityMap compute_probabilities(const BoardView& board, int mines_remaining, int per_cell) {
    Engine engine;
    return engine.compute(board, mines_remaining, per_cell);
}

} // namespace mine_prob
