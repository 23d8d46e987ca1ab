#include "mine_prob/combinatorics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace mine_prob {

namespace {
constexpr double kNegInf = -std::numeric_limits<double>::infinity();

// log_factorial の表の上限
constexpr int kMaxFactorialTable = 1 << 20;

void check_arguments(int cells, int mines, int per_cell) {
    if (cells < 0 || mines < 0) {
        throw std::invalid_argument("Cell and mine counts must be non-negative: cells=" +
                                    std::to_string(cells) + " mines=" + std::to_string(mines));
    }
    if (per_cell < 1) {
        throw std::invalid_argument("per_cell must be at least 1: " + std::to_string(per_cell));
    }
}

bool exceeds_capacity(int cells, int mines, int per_cell) {
    return static_cast<int64_t>(mines) > static_cast<int64_t>(cells) * per_cell;
}

uint64_t checked_mul(uint64_t a, uint64_t b) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        throw std::overflow_error("Arrangement count does not fit in 64 bits");
    }
    return a * b;
}

uint64_t checked_add(uint64_t a, uint64_t b) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        throw std::overflow_error("Arrangement count does not fit in 64 bits");
    }
    return a + b;
}
}  // namespace

// ===== CombinatoricsCache =====

double CombinatoricsCache::log_factorial(int n) {
    if (n < 0) {
        throw std::invalid_argument("log_factorial of negative value: " + std::to_string(n));
    }
    // 大きな n は表を作らずに lgamma で求める
    if (n >= kMaxFactorialTable) {
        return std::lgamma(static_cast<double>(n) + 1.0);
    }
    while (static_cast<int>(log_factorials_.size()) <= n) {
        double i = static_cast<double>(log_factorials_.size());
        log_factorials_.push_back(log_factorials_.back() + std::log(i));
    }
    return log_factorials_[n];
}

double CombinatoricsCache::log_binomial(int n, int k) {
    if (k < 0 || k > n) return kNegInf;
    return log_factorial(n) - log_factorial(k) - log_factorial(n - k);
}

double CombinatoricsCache::bounded_log_count(int cells, int mines, int per_cell) {
    auto& table = bounded_tables_[per_cell];
    if (mines > table.mines_cap) {
        // 列の上限が変わると既存の行は使えない
        table.mines_cap = mines;
        table.rows.clear();
    }
    if (table.rows.empty()) {
        table.rows.push_back({0.0});  // A(0, 0) = 1
    }

    while (static_cast<int>(table.rows.size()) <= cells) {
        const auto& prev = table.rows.back();
        int c = static_cast<int>(table.rows.size());
        int64_t capacity = static_cast<int64_t>(c) * per_cell;
        size_t width = static_cast<size_t>(std::min<int64_t>(capacity, table.mines_cap)) + 1;
        std::vector<double> next(width, kNegInf);
        for (size_t m = 0; m < width; ++m) {
            int mi = static_cast<int>(m);
            double acc = kNegInf;
            for (int j = 0; j <= std::min(per_cell, mi); ++j) {
                size_t rest = m - static_cast<size_t>(j);
                if (rest >= prev.size() || prev[rest] == kNegInf) continue;
                acc = log_add(acc, log_binomial(mi, j) + prev[rest]);
            }
            next[m] = acc;
        }
        table.rows.push_back(std::move(next));
    }

    const auto& row = table.rows[cells];
    if (static_cast<size_t>(mines) >= row.size()) return kNegInf;
    return row[mines];
}

size_t CombinatoricsCache::table_rows() const {
    size_t total = 0;
    for (const auto& [per_cell, table] : bounded_tables_) {
        total += table.rows.size();
    }
    return total;
}

void CombinatoricsCache::clear() {
    log_factorials_.assign(1, 0.0);
    bounded_tables_.clear();
}

// ===== 自由関数 =====

double log_add(double a, double b) {
    if (a == kNegInf) return b;
    if (b == kNegInf) return a;
    double hi = std::max(a, b);
    double lo = std::min(a, b);
    return hi + std::log1p(std::exp(lo - hi));
}

uint64_t arrangement_count(int cells, int mines, int per_cell) {
    check_arguments(cells, mines, per_cell);

    if (exceeds_capacity(cells, mines, per_cell)) {
        return 0;
    }
    if (mines == 0 || cells == 1) {
        return 1;
    }
    if (per_cell == 1) {
        // cells! / (cells - mines)!
        uint64_t result = 1;
        for (int i = cells - mines + 1; i <= cells; ++i) {
            result = checked_mul(result, static_cast<uint64_t>(i));
        }
        return result;
    }
    if (per_cell >= mines) {
        // cells^mines
        uint64_t result = 1;
        for (int i = 0; i < mines; ++i) {
            result = checked_mul(result, static_cast<uint64_t>(cells));
        }
        return result;
    }

    // 一般ケース: A(c, m) = Σ_j C(m, j) · A(c-1, m-j)
    // 二項係数はパスカルの三角形で mines 行目まで持つ
    std::vector<std::vector<uint64_t>> binom(static_cast<size_t>(mines) + 1);
    for (int n = 0; n <= mines; ++n) {
        binom[n].assign(static_cast<size_t>(n) + 1, 1);
        for (int k = 1; k < n; ++k) {
            binom[n][k] = checked_add(binom[n - 1][k - 1], binom[n - 1][k]);
        }
    }

    std::vector<uint64_t> prev(static_cast<size_t>(mines) + 1, 0);
    prev[0] = 1;
    for (int c = 1; c <= cells; ++c) {
        std::vector<uint64_t> next(static_cast<size_t>(mines) + 1, 0);
        for (int m = 0; m <= mines; ++m) {
            uint64_t acc = 0;
            for (int j = 0; j <= std::min(per_cell, m); ++j) {
                if (prev[m - j] == 0) continue;
                acc = checked_add(acc, checked_mul(binom[m][j], prev[m - j]));
            }
            next[m] = acc;
        }
        prev = std::move(next);
    }
    return prev[mines];
}

double log_arrangement_count(int cells, int mines, int per_cell, CombinatoricsCache& cache) {
    check_arguments(cells, mines, per_cell);

    if (exceeds_capacity(cells, mines, per_cell)) {
        return kNegInf;
    }
    if (mines == 0 || cells == 1) {
        return 0.0;
    }
    if (per_cell == 1) {
        return cache.log_factorial(cells) - cache.log_factorial(cells - mines);
    }
    if (per_cell >= mines) {
        return static_cast<double>(mines) * std::log(static_cast<double>(cells));
    }
    return cache.bounded_log_count(cells, mines, per_cell);
}

double unsafe_probability(int cells, int mines, int per_cell, CombinatoricsCache& cache) {
    check_arguments(cells, mines, per_cell);
    if (cells < 1) {
        throw std::invalid_argument("unsafe_probability requires at least one cell");
    }
    if (exceeds_capacity(cells, mines, per_cell)) {
        throw std::invalid_argument("Too many mines for the space in the cells: " +
                                    std::to_string(mines) + " mines, " +
                                    std::to_string(cells) + " cells, " +
                                    std::to_string(per_cell) + " max per cell");
    }

    // 空きが作れない
    if (static_cast<int64_t>(mines) > static_cast<int64_t>(per_cell) * (cells - 1)) {
        return 1.0;
    }
    if (per_cell == 1) {
        return static_cast<double>(mines) / static_cast<double>(cells);
    }
    // 1セルあたりの上限が実質無制限
    if (per_cell >= mines) {
        return 1.0 - std::pow(1.0 - 1.0 / static_cast<double>(cells), mines);
    }
    double log_empty = log_arrangement_count(cells - 1, mines, per_cell, cache);
    double log_all = log_arrangement_count(cells, mines, per_cell, cache);
    return 1.0 - std::exp(log_empty - log_all);
}

double unsafe_probability(int cells, int mines, int per_cell) {
    CombinatoricsCache cache;
    return unsafe_probability(cells, mines, per_cell, cache);
}

} // namespace mine_prob
