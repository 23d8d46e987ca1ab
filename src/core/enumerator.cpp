#include "mine_prob/enumerator.hpp"
#include "mine_prob/errors.hpp"
#include <algorithm>
#include <string>

namespace mine_prob {

ConfigEnumerator::ConfigEnumerator(const std::vector<NumberConstraint>& constraints,
                                   const GroupLayout& layout,
                                   EnumerationBudget budget)
    : constraints_(constraints)
    , layout_(layout)
    , budget_(budget) {
    const auto& groups = layout_.groups;
    config_.assign(groups.size(), 0);
    upper_.assign(groups.size(), 0);
    assigned_.assign(constraints_.size(), 0);

    tail_capacity_.resize(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        for (size_t c : groups[i].constraint_ids) {
            int tail = 0;
            for (size_t g : layout_.constraint_groups[c]) {
                if (g > i) tail += groups[g].max_mines;
            }
            tail_capacity_[i].push_back(tail);
        }
    }

    if (budget_.time_limit.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + budget_.time_limit;
    }
}

bool ConfigEnumerator::next(Configuration& cfg) {
    const size_t num_groups = layout_.groups.size();

    while (!done_) {
        if (depth_ == num_groups) {
            // 末端: 全制約の部分和が residual と一致するか再確認
            bool valid = all_satisfied();
            if (valid) {
                if (budget_.max_configurations > 0 &&
                    stats_.configuration_count >= budget_.max_configurations) {
                    throw SolverTimeoutError(
                        "Enumeration exceeded the budget of " +
                        std::to_string(budget_.max_configurations) + " configurations");
                }
                cfg = config_;
                stats_.configuration_count++;
            } else {
                stats_.rejected_count++;
            }
            advance();
            if (valid) return true;
            continue;
        }

        check_budget();
        stats_.branch_count++;

        int lower = 0;
        int upper = 0;
        if (!bounds_for(depth_, lower, upper)) {
            stats_.dead_end_count++;
            advance();
            continue;
        }
        upper_[depth_] = upper;
        assign(depth_, lower);
        depth_++;
    }
    return false;
}

void ConfigEnumerator::assign(size_t depth, int value) {
    config_[depth] = value;
    for (size_t c : layout_.groups[depth].constraint_ids) {
        assigned_[c] += value;
    }
}

void ConfigEnumerator::unassign(size_t depth) {
    for (size_t c : layout_.groups[depth].constraint_ids) {
        assigned_[c] -= config_[depth];
    }
    config_[depth] = 0;
}

void ConfigEnumerator::advance() {
    // 値を増やせる最も深いグループまで戻る
    while (depth_ > 0) {
        size_t d = depth_ - 1;
        int current = config_[d];
        unassign(d);
        if (current < upper_[d]) {
            assign(d, current + 1);
            return;
        }
        depth_ = d;
    }
    done_ = true;
}

void ConfigEnumerator::check_budget() {
    if (budget_.stop_flag && budget_.stop_flag->load()) {
        throw SolverTimeoutError("Enumeration stopped on request");
    }
    if (budget_.time_limit.count() > 0 && std::chrono::steady_clock::now() > deadline_) {
        throw SolverTimeoutError("Enumeration exceeded the time limit of " +
                                 std::to_string(budget_.time_limit.count()) + " ms");
    }
}

bool ConfigEnumerator::bounds_for(size_t depth, int& lower, int& upper) const {
    const auto& group = layout_.groups[depth];
    lower = 0;
    upper = group.max_mines;
    for (size_t k = 0; k < group.constraint_ids.size(); ++k) {
        size_t c = group.constraint_ids[k];
        int remaining = constraints_[c].residual - assigned_[c];
        upper = std::min(upper, remaining);
        lower = std::max(lower, remaining - tail_capacity_[depth][k]);
    }
    return lower <= upper;
}

bool ConfigEnumerator::all_satisfied() const {
    for (size_t c = 0; c < constraints_.size(); ++c) {
        if (assigned_[c] != constraints_[c].residual) return false;
    }
    return true;
}

std::vector<Configuration> enumerate_all(const std::vector<NumberConstraint>& constraints,
                                         const GroupLayout& layout,
                                         EnumerationBudget budget) {
    ConfigEnumerator enumerator(constraints, layout, budget);
    std::vector<Configuration> result;
    Configuration cfg;
    while (enumerator.next(cfg)) {
        result.push_back(cfg);
    }
    return result;
}

} // namespace mine_prob
