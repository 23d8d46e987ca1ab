#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mine_prob/combiner.hpp"
#include "mine_prob/constraint.hpp"
#include "mine_prob/engine.hpp"
#include "mine_prob/errors.hpp"
#include "mine_prob/group.hpp"
#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <map>
#include <stdexcept>
#include <vector>

using namespace mine_prob;
using Catch::Approx;

static Board make_row(const std::vector<CellContents>& cells, int detection = 1) {
    Board board(static_cast<int>(cells.size()), 1, detection);
    for (size_t x = 0; x < cells.size(); ++x) {
        board.set(Coord{static_cast<int>(x), 0}, cells[x]);
    }
    return board;
}

// Helper: 互いに独立な "# 1 # 1 #" を 0 で区切って count 個並べる
// 各クラスタは配置が2通りなので、全体で 2^count 通り
static Board make_clusters(int count) {
    std::vector<CellContents> cells;
    for (int i = 0; i < count; ++i) {
        cells.insert(cells.end(), {Unclicked{}, Num{1}, Unclicked{}, Num{1}, Unclicked{}, Num{0}});
    }
    return make_row(cells);
}

// Helper: 各グループの地雷数分布の和が 1 になっているか
static void require_normalised(const ProbabilityReport& report) {
    for (const auto& dist : report.group_distributions) {
        double sum = 0.0;
        for (double p : dist) sum += p;
        REQUIRE(std::fabs(sum - 1.0) <= 1e-6);
    }
}

// Helper: 1セル1個の場合の厳密な確率を全探索で求める
static std::map<Coord, double> brute_force(const Board& board, int mines) {
    std::vector<Coord> unknown;
    std::vector<Coord> numbers;
    for (const auto& c : board.all_coords()) {
        auto contents = board.cell_contents(c);
        if (std::holds_alternative<Unclicked>(contents)) unknown.push_back(c);
        if (std::holds_alternative<Num>(contents)) numbers.push_back(c);
    }

    std::map<Coord, double> hits;
    double total = 0.0;
    const size_t n = unknown.size();
    for (unsigned long mask = 0; mask < (1UL << n); ++mask) {
        if (__builtin_popcountl(mask) != mines) continue;
        std::map<Coord, bool> mine;
        for (size_t i = 0; i < n; ++i) mine[unknown[i]] = (mask >> i) & 1UL;

        bool ok = true;
        for (const auto& c : numbers) {
            int count = 0;
            for (const auto& nb : board.neighbors(c)) {
                auto it = mine.find(nb);
                if (it != mine.end() && it->second) count++;
            }
            if (count != std::get<Num>(board.cell_contents(c)).value) ok = false;
        }
        if (!ok) continue;

        total += 1.0;
        for (size_t i = 0; i < n; ++i) {
            if ((mask >> i) & 1UL) hits[unknown[i]] += 1.0;
        }
    }

    std::map<Coord, double> result;
    for (const auto& c : unknown) result[c] = hits[c] / total;
    return result;
}

// Helper: 1セル per_cell 個までの場合。区別できる地雷の配置数で重み付けする
static void brute_force_bounded(const Board& board, const std::vector<Coord>& unknown,
                                const std::vector<Coord>& numbers, int per_cell,
                                int mines_left, size_t index, std::map<Coord, int>& counts,
                                double weight, std::map<Coord, double>& hits, double& total) {
    if (index == unknown.size()) {
        if (mines_left != 0) return;
        for (const auto& c : numbers) {
            int sum = 0;
            for (const auto& nb : board.neighbors(c)) {
                auto it = counts.find(nb);
                if (it != counts.end()) sum += it->second;
            }
            if (sum != std::get<Num>(board.cell_contents(c)).value) return;
        }
        total += weight;
        for (const auto& [coord, count] : counts) {
            if (count > 0) hits[coord] += weight;
        }
        return;
    }
    // weight は k! / Π c_i! を c_i ごとに掛けていく
    double factor = 1.0;
    for (int c = 0; c <= std::min(per_cell, mines_left); ++c) {
        if (c > 0) factor /= c;
        counts[unknown[index]] = c;
        brute_force_bounded(board, unknown, numbers, per_cell, mines_left - c, index + 1,
                            counts, weight * factor, hits, total);
    }
    counts.erase(unknown[index]);
}

// ============================================================================
// Basic boards
// ============================================================================

TEST_CASE("Engine single constraint", "[engine]") {
    auto board = make_row({Unclicked{}, Num{1}, Unclicked{}});
    auto probs = compute_probabilities(board, 1, 1);
    REQUIRE(probs.size() == 2);
    REQUIRE(probs.at(Coord{0, 0}) == Approx(0.5));
    REQUIRE(probs.at(Coord{2, 0}) == Approx(0.5));
}

TEST_CASE("Engine certain mines", "[engine]") {
    Board board(2, 2);
    board.set(Coord{0, 0}, Num{3});

    SECTION("all neighbours are mines") {
        auto probs = compute_probabilities(board, 3, 1);
        REQUIRE(probs.size() == 3);
        for (const auto& [coord, p] : probs) {
            REQUIRE(p == Approx(1.0));
        }
    }

    SECTION("one mine too many") {
        REQUIRE_THROWS_AS(compute_probabilities(board, 4, 1), NoSolutionError);
    }
}

TEST_CASE("Engine flags and outer region", "[engine]") {
    auto board = make_row({Flag{1}, Num{1}, Unclicked{}, Unclicked{}});
    Engine engine;
    auto report = engine.solve(board, 1, 1);

    REQUIRE(report.probabilities.size() == 2);
    REQUIRE(report.probabilities.at(Coord{2, 0}) == Approx(0.0));
    REQUIRE(report.probabilities.at(Coord{3, 0}) == Approx(1.0));
    REQUIRE(report.outer_cell_count == 1);
    REQUIRE(report.outer_mines == 1);
    REQUIRE(report.outer_probability.has_value());
    REQUIRE(*report.outer_probability == Approx(1.0));

    REQUIRE(engine.stats().constraint_count == 1);
    REQUIRE(engine.stats().edge_cell_count == 1);
    REQUIRE(engine.stats().outer_cell_count == 1);
}

TEST_CASE("Engine uniform fallback", "[engine]") {
    Board board(5, 2);

    SECTION("every cell is a mine") {
        Engine engine;
        auto report = engine.solve(board, 10, 1);
        REQUIRE(report.uniform);
        REQUIRE(engine.stats().used_uniform_fallback);
        REQUIRE(report.probabilities.size() == 10);
        for (const auto& [coord, p] : report.probabilities) {
            REQUIRE(p == Approx(1.0));
        }
    }

    SECTION("density") {
        auto probs = compute_probabilities(board, 3, 1);
        for (const auto& [coord, p] : probs) {
            REQUIRE(p == Approx(0.3));
        }
    }

    SECTION("several mines per cell") {
        auto probs = compute_probabilities(board, 2, 2);
        // 1 - (9/10)^2
        REQUIRE(probs.at(Coord{0, 0}) == Approx(0.19));
    }

    SECTION("zero is not a constraint") {
        auto row = make_row({Num{0}, Unclicked{}, Unclicked{}});
        auto probs = compute_probabilities(row, 1, 1);
        REQUIRE(probs.at(Coord{1, 0}) == Approx(0.5));
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.5));
    }

    SECTION("no unclicked cells") {
        auto row = make_row({Num{1}, Flag{1}});
        REQUIRE(compute_probabilities(row, 0, 1).empty());
        REQUIRE_THROWS_AS(compute_probabilities(row, 1, 1), NoSolutionError);
    }

    SECTION("too many mines") {
        REQUIRE_THROWS_AS(compute_probabilities(board, 11, 1), NoSolutionError);
    }
}

TEST_CASE("Engine wide detection radius", "[engine]") {
    Board board(100, 1, 60);
    board.set(Coord{0, 0}, Num{20});
    Engine engine;
    auto report = engine.solve(board, 30, 1);

    REQUIRE(report.probabilities.size() == 99);
    REQUIRE(report.group_probabilities.size() == 1);
    REQUIRE(report.probabilities.at(Coord{1, 0}) == Approx(1.0 / 3.0));
    REQUIRE(report.probabilities.at(Coord{60, 0}) == Approx(1.0 / 3.0));
    REQUIRE(report.outer_cell_count == 39);
    REQUIRE(report.outer_mines == 10);
    REQUIRE(report.probabilities.at(Coord{61, 0}) == Approx(10.0 / 39.0));
    REQUIRE(report.probabilities.at(Coord{99, 0}) == Approx(10.0 / 39.0));
}

TEST_CASE("Engine several mines per cell", "[engine]") {
    // (5,0) は外側領域
    auto board = make_row({Unclicked{}, Num{2}, Unclicked{}, Num{1}, Unclicked{}, Unclicked{}});
    Engine engine;
    auto report = engine.solve(board, 3, 2);

    REQUIRE(report.configuration_count == 2);
    REQUIRE(report.weighted_configuration_count == 2);
    require_normalised(report);
    REQUIRE(report.probabilities.at(Coord{0, 0}) == Approx(1.0));
    REQUIRE(report.probabilities.at(Coord{2, 0}) == Approx(2.0 / 3.0));
    REQUIRE(report.probabilities.at(Coord{4, 0}) == Approx(1.0 / 3.0));

    SECTION("group distributions") {
        REQUIRE(report.group_distributions.size() == 3);
        // グループ0: 1個が 6/9, 2個が 3/9
        REQUIRE(report.group_distributions[0][1] == Approx(2.0 / 3.0));
        REQUIRE(report.group_distributions[0][2] == Approx(1.0 / 3.0));
        REQUIRE(report.expected_edge_mines == Approx(7.0 / 3.0));
        REQUIRE(report.outer_mines == 1);
    }

    SECTION("mine count too small for every configuration") {
        REQUIRE_THROWS_AS(engine.solve(board, 1, 2), NoSolutionError);
    }
}

// ============================================================================
// Exactness and invariants
// ============================================================================

TEST_CASE("Engine matches brute force", "[engine]") {
    Board board(4, 3);
    board.set(Coord{1, 1}, Num{2});
    board.set(Coord{2, 1}, Num{1});

    auto expected = brute_force(board, 3);
    Engine engine;
    auto probs = engine.compute(board, 3, 1);

    REQUIRE(probs.size() == expected.size());
    double sum = 0.0;
    for (const auto& [coord, p] : expected) {
        REQUIRE(probs.at(coord) == Approx(p));
        sum += probs.at(coord);
    }
    // 外側がないので確率の和は地雷数に一致する
    REQUIRE(sum == Approx(3.0));
    REQUIRE(engine.stats().constraint_count == 2);
    REQUIRE(!engine.stats().used_uniform_fallback);
}

TEST_CASE("Engine matches brute force with two mines per cell", "[engine]") {
    Board board(4, 2);
    board.set(Coord{1, 0}, Num{2});
    board.set(Coord{2, 1}, Num{3});

    std::vector<Coord> unknown;
    std::vector<Coord> numbers{Coord{1, 0}, Coord{2, 1}};
    for (const auto& c : board.all_coords()) {
        if (std::holds_alternative<Unclicked>(board.cell_contents(c))) unknown.push_back(c);
    }
    REQUIRE(unknown.size() == 6);

    std::map<Coord, int> counts;
    std::map<Coord, double> hits;
    double total = 0.0;
    brute_force_bounded(board, unknown, numbers, 2, 4, 0, counts, 1.0, hits, total);
    REQUIRE(total > 0.0);

    Engine engine;
    auto report = engine.solve(board, 4, 2);
    require_normalised(report);
    const auto& probs = report.probabilities;
    REQUIRE(probs.size() == unknown.size());
    for (const auto& c : unknown) {
        REQUIRE(probs.at(c) == Approx(hits[c] / total));
    }
}

TEST_CASE("Engine probabilities are in range", "[engine]") {
    Board board(5, 5);
    board.set(Coord{1, 1}, Num{1});
    board.set(Coord{2, 1}, Num{2});
    board.set(Coord{3, 1}, Num{1});
    board.set(Coord{2, 3}, Num{3});

    auto probs = compute_probabilities(board, 6, 1);
    REQUIRE(probs.size() == 21);
    for (const auto& [coord, p] : probs) {
        REQUIRE(p >= 0.0);
        REQUIRE(p <= 1.0);
    }
}

TEST_CASE("Engine symmetry and determinism", "[engine]") {
    Board board(3, 3);
    board.set(Coord{1, 1}, Num{1});

    Engine engine;
    auto first = engine.compute(board, 1, 1);
    auto second = engine.compute(board, 1, 1);
    REQUIRE(first == second);

    REQUIRE(first.size() == 8);
    // 同じグループのセルは完全に同じ値
    const double shared = first.begin()->second;
    REQUIRE(shared == Approx(1.0 / 8.0));
    for (const auto& [coord, p] : first) {
        REQUIRE(p == shared);
    }

    SECTION("groups in a larger board") {
        Board grid(5, 5);
        grid.set(Coord{1, 1}, Num{1});
        grid.set(Coord{3, 3}, Num{2});
        auto report = engine.solve(grid, 5, 1);
        require_normalised(report);
        auto layout = find_groups(extract_constraints(grid, 1), 1);
        REQUIRE(layout.groups.size() == report.group_probabilities.size());
        for (size_t i = 0; i < layout.groups.size(); ++i) {
            for (const auto& coord : layout.groups[i].coords) {
                REQUIRE(report.probabilities.at(coord) == report.group_probabilities[i]);
            }
        }
        // 外側セルも全て同じ値
        REQUIRE(report.outer_probability.has_value());
        REQUIRE(report.probabilities.at(Coord{0, 4}) == *report.outer_probability);
        REQUIRE(report.probabilities.at(Coord{4, 0}) == *report.outer_probability);
    }
}

TEST_CASE("Engine cell kinds", "[engine]") {
    SECTION("revealed mines are candidates") {
        auto board = make_row({Mine{1}, Num{1}, Unclicked{}});
        auto probs = compute_probabilities(board, 1, 1);
        REQUIRE(probs.at(Coord{0, 0}) == Approx(0.5));
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.5));
    }

    SECTION("hit mines are pinned") {
        auto board = make_row({HitMine{1}, Num{1}, Unclicked{}});
        auto probs = compute_probabilities(board, 0, 1);
        REQUIRE(probs.size() == 1);
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.0));
    }

    SECTION("wrong flags are pinned like flags") {
        auto board = make_row({WrongFlag{1}, Num{1}, Unclicked{}});
        auto probs = compute_probabilities(board, 0, 1);
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.0));
    }
}

TEST_CASE("Engine ignore flags", "[engine]") {
    auto board = make_row({Flag{1}, Num{1}, Unclicked{}});
    Engine engine;

    SECTION("flags honoured") {
        auto probs = engine.compute(board, 0, 1);
        REQUIRE(probs.size() == 1);
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.0));
    }

    SECTION("flags ignored") {
        engine.set_ignore_flags(true);
        REQUIRE(engine.ignore_flags());
        auto probs = engine.compute(board, 0, 1);
        REQUIRE(probs.size() == 2);
        REQUIRE(probs.at(Coord{0, 0}) == Approx(0.5));
        REQUIRE(probs.at(Coord{2, 0}) == Approx(0.5));
    }
}

// ============================================================================
// Errors and budget
// ============================================================================

TEST_CASE("Engine errors", "[engine]") {
    SECTION("malformed board") {
        auto board = make_row({Flag{1}, Num{1}, Flag{1}});
        REQUIRE_THROWS_AS(compute_probabilities(board, 0, 1), MalformedBoardError);
    }

    SECTION("contradictory numbers") {
        Board board(2, 2);
        board.set(Coord{0, 0}, Num{1});
        board.set(Coord{0, 1}, Num{2});
        REQUIRE_THROWS_AS(compute_probabilities(board, 2, 1), NoSolutionError);
    }

    SECTION("invalid arguments") {
        Board board(2, 2);
        REQUIRE_THROWS_AS(compute_probabilities(board, -1, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(compute_probabilities(board, 1, 0), std::invalid_argument);
    }
}

TEST_CASE("Engine budget", "[engine]") {
    auto board = make_row({Unclicked{}, Num{2}, Unclicked{}, Num{1}, Unclicked{}, Unclicked{}});
    Engine engine;
    REQUIRE(engine.max_configurations() == 1000000);

    SECTION("configuration limit") {
        engine.set_max_configurations(1);
        REQUIRE_THROWS_AS(engine.compute(board, 3, 2), SolverTimeoutError);
    }

    SECTION("stop request") {
        engine.stop();
        REQUIRE(engine.is_stopped());
        REQUIRE_THROWS_AS(engine.compute(board, 3, 2), SolverTimeoutError);

        engine.reset_stop();
        REQUIRE(!engine.is_stopped());
        REQUIRE(engine.compute(board, 3, 2).size() == 4);
    }

    SECTION("unlimited") {
        engine.set_max_configurations(0);
        REQUIRE(engine.compute(board, 3, 2).size() == 4);
    }
}

TEST_CASE("Engine mine count above capacity", "[engine]") {
    auto board = make_row({Unclicked{}, Num{1}, Unclicked{}});

    SECTION("rejected before enumeration") {
        REQUIRE_THROWS_AS(compute_probabilities(board, 3, 1), NoSolutionError);
        REQUIRE_THROWS_AS(compute_probabilities(board, 20000000, 1), NoSolutionError);
        REQUIRE_THROWS_AS(compute_probabilities(board, INT_MAX, 1), NoSolutionError);
    }

    SECTION("returned flags do not overflow") {
        auto flagged = make_row({Flag{INT_MAX}, Num{1}, Unclicked{}});
        Engine engine;
        engine.set_ignore_flags(true);
        REQUIRE_THROWS_AS(engine.compute(flagged, INT_MAX, 1), NoSolutionError);
    }

    SECTION("capacity grows with per_cell") {
        // 2セル x 2個 = 4 個までは容量内
        REQUIRE_THROWS_AS(compute_probabilities(board, 5, 2), NoSolutionError);
        auto probs = compute_probabilities(board, 1, 2);
        REQUIRE(probs.at(Coord{0, 0}) == Approx(0.5));
    }
}

TEST_CASE("Engine time limit", "[engine]") {
    auto board = make_clusters(20);
    Engine engine;
    engine.set_max_configurations(0);
    REQUIRE(engine.time_limit().count() == 0);

    SECTION("exceeded") {
        engine.set_time_limit(std::chrono::milliseconds(1));
        REQUIRE(engine.time_limit() == std::chrono::milliseconds(1));
        REQUIRE_THROWS_AS(engine.compute(board, 30, 1), SolverTimeoutError);
    }

    SECTION("generous limit on a small board") {
        engine.set_time_limit(std::chrono::milliseconds(10000));
        auto probs = engine.compute(make_clusters(2), 3, 1);
        REQUIRE(probs.size() == 6);
    }
}

TEST_CASE("Engine tolerance", "[engine]") {
    Engine engine;
    REQUIRE(engine.tolerance() == Approx(1e-4));
    REQUIRE_THROWS_AS(engine.set_tolerance(-1e-3), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.set_tolerance(std::nan("")), std::invalid_argument);

    engine.set_tolerance(0.0);
    REQUIRE(engine.tolerance() == 0.0);
    auto board = make_row({Unclicked{}, Num{1}, Unclicked{}});
    REQUIRE(engine.compute(board, 1, 1).at(Coord{0, 0}) == Approx(0.5));
}

// ============================================================================
// Combiner
// ============================================================================

TEST_CASE("ProbabilityCombiner streaming", "[combiner]") {
    auto board = make_row({Unclicked{}, Num{2}, Unclicked{}, Num{1}, Unclicked{}, Unclicked{}});
    auto constraints = extract_constraints(board, 2);
    auto layout = find_groups(constraints, 2);
    CombinatoricsCache cache;
    const std::vector<Coord> outer{Coord{5, 0}};

    ProbabilityCombiner combiner(layout, 2, 3, 4, cache);
    REQUIRE(combiner.configuration_count() == 0);
    REQUIRE_THROWS_AS(combiner.finish(outer), NoSolutionError);

    combiner.add(Configuration{1, 1, 0});
    combiner.add(Configuration{2, 0, 1});
    REQUIRE(combiner.configuration_count() == 2);

    auto report = combiner.finish(outer);
    require_normalised(report);
    REQUIRE(report.group_probabilities[0] == Approx(1.0));
    REQUIRE(report.group_probabilities[1] == Approx(2.0 / 3.0));
    REQUIRE(report.group_probabilities[2] == Approx(1.0 / 3.0));

    SECTION("invalid configurations") {
        REQUIRE_THROWS_AS(combiner.add(Configuration{3, 0, 0}), std::invalid_argument);
        REQUIRE_THROWS_AS(combiner.add(Configuration{1, 1}), std::invalid_argument);
        REQUIRE(combiner.configuration_count() == 2);
    }

    SECTION("mine count above capacity") {
        REQUIRE_THROWS_AS(ProbabilityCombiner(layout, 2, 9, 4, cache), NoSolutionError);
    }
}
