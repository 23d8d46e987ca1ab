/**
 * @file enumerator.hpp
 * @brief グループごとの地雷数の配置（configuration）の深さ優先列挙
 */
#ifndef MINE_PROB_ENUMERATOR_HPP
#define MINE_PROB_ENUMERATOR_HPP

#include "mine_prob/constraint.hpp"
#include "mine_prob/group.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <vector>

namespace mine_prob {

/**
 * @brief 配置: configuration[i] = グループ i の地雷数
 */
using Configuration = std::vector<int>;

/**
 * @brief 列挙の予算
 *
 * 各分岐で確認し、超えたら SolverTimeoutError を送出する。
 */
struct EnumerationBudget {
    size_t max_configurations = 0;               // 0 = 無制限
    std::chrono::milliseconds time_limit{0};     // 0 = 無制限
    const std::atomic<bool>* stop_flag = nullptr; // true になったら停止
};

/**
 * @brief 列挙の統計情報
 */
struct EnumerationStats {
    size_t branch_count = 0;         // 訪れた分岐（部分配置）の数
    size_t dead_end_count = 0;       // 下限 > 上限で打ち切った数
    size_t rejected_count = 0;       // 末端で残り数が合わなかった数
    size_t configuration_count = 0;  // 生成した有効な配置の数
};

/**
 * @brief 有効な配置を1つずつ遅延生成する列挙器
 *
 * グループを固定順に割り当て、各数字制約の部分和を持ち回る。
 * グループ i の地雷数の範囲:
 * - 下限 = max(0, max_c (residual_c - 割当済み_c - 後続グループの max_mines の和_c))
 * - 上限 = min(max_mines_i, min_c (residual_c - 割当済み_c))
 *
 * 生成順は辞書式順序。constraints と layout は列挙器より長く生存すること。
 */
class ConfigEnumerator {
public:
    /**
     * @param constraints 数字制約
     * @param layout find_groups() の結果
     * @param budget 列挙の予算
     */
    ConfigEnumerator(const std::vector<NumberConstraint>& constraints,
                     const GroupLayout& layout,
                     EnumerationBudget budget = EnumerationBudget{});

    /**
     * @brief 次の有効な配置を取得
     * @param cfg 出力先
     * @return 配置があれば true、列挙が終わったら false
     * @throws SolverTimeoutError 予算超過または停止要求
     */
    bool next(Configuration& cfg);

    /**
     * @brief 統計情報を取得
     */
    const EnumerationStats& stats() const { return stats_; }

private:
    void assign(size_t depth, int value);
    void unassign(size_t depth);
    void advance();
    void check_budget();
    bool bounds_for(size_t depth, int& lower, int& upper) const;
    bool all_satisfied() const;

    const std::vector<NumberConstraint>& constraints_;
    const GroupLayout& layout_;
    EnumerationBudget budget_;
    std::chrono::steady_clock::time_point deadline_;

    // tail_capacity_[i][k] = グループ i の k 番目の隣接制約について、
    // i より後ろの隣接グループの max_mines の和
    std::vector<std::vector<int>> tail_capacity_;

    Configuration config_;        // 現在の部分配置
    std::vector<int> upper_;      // 各深さの上限
    std::vector<int> assigned_;   // 制約ごとの割当済み地雷数
    size_t depth_ = 0;            // 割当済みグループ数
    bool done_ = false;

    EnumerationStats stats_;
};

/**
 * @brief 全ての有効な配置を列挙して返す
 * @throws SolverTimeoutError 予算超過
 */
std::vector<Configuration> enumerate_all(const std::vector<NumberConstraint>& constraints,
                                         const GroupLayout& layout,
                                         EnumerationBudget budget = EnumerationBudget{});

} // namespace mine_prob

#endif // MINE_PROB_ENUMERATOR_HPP
