#include "mine_prob/combiner.hpp"
#include "mine_prob/errors.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace mine_prob {

namespace {
constexpr double kNegInf = -std::numeric_limits<double>::infinity();

// 分布の和が 1 からずれてよい幅
constexpr double kDistributionTolerance = 1e-6;
}  // namespace

ProbabilityCombiner::ProbabilityCombiner(const GroupLayout& layout, int per_cell,
                                         int mines_remaining, int unclicked_count,
                                         CombinatoricsCache& cache, double tolerance)
    : layout_(layout)
    , per_cell_(per_cell)
    , mines_(mines_remaining)
    , outer_size_(unclicked_count - static_cast<int>(layout.edge_cell_count))
    , cache_(cache)
    , tolerance_(tolerance)
    , log_total_(kNegInf) {
    if (per_cell < 1) {
        throw std::invalid_argument("per_cell must be at least 1: " + std::to_string(per_cell));
    }
    if (mines_remaining < 0) {
        throw std::invalid_argument("mines_remaining must be non-negative: " +
                                    std::to_string(mines_remaining));
    }
    if (outer_size_ < 0) {
        throw std::invalid_argument("Unclicked cell count " + std::to_string(unclicked_count) +
                                    " is smaller than the edge cell count " +
                                    std::to_string(layout.edge_cell_count));
    }

    if (static_cast<int64_t>(mines_) > static_cast<int64_t>(unclicked_count) * per_cell_) {
        throw NoSolutionError(std::to_string(mines_) + " mines do not fit in " +
                              std::to_string(unclicked_count) + " unclicked cells");
    }

    log_k_factorial_ = cache_.log_factorial(mines_);

    int max_edge_mines = 0;
    const auto& groups = layout_.groups;
    group_terms_.resize(groups.size());
    log_mass_.resize(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        int size = static_cast<int>(groups[i].size());
        for (int j = 0; j <= groups[i].max_mines; ++j) {
            group_terms_[i].push_back(log_arrangement_count(size, j, per_cell_, cache_) -
                                      cache_.log_factorial(j));
        }
        log_mass_[i].assign(group_terms_[i].size(), kNegInf);
        max_edge_mines += groups[i].max_mines;
    }

    // 外側領域の項は M だけで決まるので先に計算しておく
    int64_t outer_capacity = static_cast<int64_t>(outer_size_) * per_cell_;
    outer_terms_.assign(static_cast<size_t>(max_edge_mines) + 1, kNegInf);
    for (int m = 0; m <= max_edge_mines; ++m) {
        int rest = mines_ - m;
        if (rest < 0 || rest > outer_capacity) continue;
        outer_terms_[m] = log_arrangement_count(outer_size_, rest, per_cell_, cache_) -
                          cache_.log_factorial(rest);
    }
}

void ProbabilityCombiner::add(const Configuration& cfg) {
    const auto& groups = layout_.groups;
    if (cfg.size() != groups.size()) {
        throw std::invalid_argument("Configuration has " + std::to_string(cfg.size()) +
                                    " entries for " + std::to_string(groups.size()) + " groups");
    }

    int total = 0;
    double log_weight = log_k_factorial_;
    for (size_t i = 0; i < cfg.size(); ++i) {
        if (cfg[i] < 0 || cfg[i] > groups[i].max_mines) {
            throw std::invalid_argument("Configuration entry " + std::to_string(cfg[i]) +
                                        " out of range for group " + std::to_string(i));
        }
        total += cfg[i];
        log_weight += group_terms_[i][cfg[i]];
    }
    log_weight += outer_terms_[total];
    configuration_count_++;

    if (log_weight == kNegInf) return;  // 残り地雷数と合わない
    weighted_count_++;
    log_total_ = log_add(log_total_, log_weight);
    for (size_t i = 0; i < cfg.size(); ++i) {
        log_mass_[i][cfg[i]] = log_add(log_mass_[i][cfg[i]], log_weight);
    }
}

ProbabilityReport ProbabilityCombiner::finish(const std::vector<Coord>& outer_cells) const {
    if (configuration_count_ == 0) {
        throw NoSolutionError("The constraint system has no valid configuration");
    }
    if (log_total_ == kNegInf) {
        throw NoSolutionError("No configuration is consistent with " + std::to_string(mines_) +
                              " remaining mines");
    }
    if (static_cast<int>(outer_cells.size()) != outer_size_) {
        throw std::invalid_argument("Expected " + std::to_string(outer_size_) +
                                    " outer cells, got " + std::to_string(outer_cells.size()));
    }

    ProbabilityReport report;
    report.configuration_count = configuration_count_;
    report.weighted_configuration_count = weighted_count_;
    report.outer_cell_count = outer_cells.size();

    const auto& groups = layout_.groups;
    double expected = 0.0;
    for (size_t i = 0; i < groups.size(); ++i) {
        int size = static_cast<int>(groups[i].size());
        std::vector<double> dist(log_mass_[i].size(), 0.0);
        double unsafe = 0.0;
        for (size_t j = 0; j < dist.size(); ++j) {
            if (log_mass_[i][j] == kNegInf) continue;
            dist[j] = std::exp(log_mass_[i][j] - log_total_);
            unsafe += dist[j] * unsafe_probability(size, static_cast<int>(j), per_cell_, cache_);
            expected += static_cast<double>(j) * dist[j];
        }

        double sum = std::accumulate(dist.begin(), dist.end(), 0.0);
        if (std::fabs(sum - 1.0) > kDistributionTolerance) {
            throw InternalConsistencyError("Mine count distribution of group " +
                                           std::to_string(i) + " sums to " +
                                           std::to_string(sum));
        }

        unsafe = checked_probability(unsafe, "edge group");
        for (const auto& coord : groups[i].coords) {
            report.probabilities[coord] = unsafe;
        }
        report.group_distributions.push_back(std::move(dist));
        report.group_probabilities.push_back(unsafe);
    }
    report.expected_edge_mines = expected;

    if (outer_size_ > 0) {
        int outer_mines = mines_ - static_cast<int>(std::llround(expected));
        if (outer_mines < 0 ||
            static_cast<int64_t>(outer_mines) > static_cast<int64_t>(outer_size_) * per_cell_) {
            throw InternalConsistencyError("Outer region estimate of " +
                                           std::to_string(outer_mines) + " mines does not fit in " +
                                           std::to_string(outer_size_) + " cells");
        }
        double outer = checked_probability(
            unsafe_probability(outer_size_, outer_mines, per_cell_, cache_), "outer region");
        for (const auto& coord : outer_cells) {
            report.probabilities[coord] = outer;
        }
        report.outer_mines = outer_mines;
        report.outer_probability = outer;
    }
    return report;
}

double ProbabilityCombiner::checked_probability(double value, const char* what) const {
    if (!(value >= -tolerance_ && value <= 1.0 + tolerance_)) {
        throw InternalConsistencyError(std::string("Probability ") + std::to_string(value) +
                                       " for " + what + " is outside [0, 1]");
    }
    if (value < 0.0) return 0.0;
    if (value > 1.0) return 1.0;
    return value;
}

} // namespace mine_prob
