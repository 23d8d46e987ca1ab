/**
 * @file combiner.hpp
 * @brief 配置の重み付けとセルごとの危険確率の合成
 */
#ifndef MINE_PROB_COMBINER_HPP
#define MINE_PROB_COMBINER_HPP

#include "mine_prob/board.hpp"
#include "mine_prob/combinatorics.hpp"
#include "mine_prob/enumerator.hpp"
#include "mine_prob/group.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace mine_prob {

/**
 * @brief 座標 -> 地雷が1個以上ある確率
 */
using ProbabilityMap = std::map<Coord, double>;

/**
 * @brief 確率計算の結果一式
 */
struct ProbabilityReport {
    /// 全ての未確定セルの確率
    ProbabilityMap probabilities;

    /// group_distributions[i][j] = P(グループ i の地雷数 = j), j = 0..max_mines
    std::vector<std::vector<double>> group_distributions;

    /// グループ i の各セルの確率
    std::vector<double> group_probabilities;

    /// 境界グループの地雷数の期待値 E
    double expected_edge_mines = 0.0;

    size_t outer_cell_count = 0;
    int outer_mines = 0;                    ///< k - round(E)
    std::optional<double> outer_probability; ///< 外側セルがなければ nullopt

    size_t configuration_count = 0;          ///< 有効な配置の数
    size_t weighted_configuration_count = 0; ///< 重みが 0 でない配置の数

    bool uniform = false;  ///< 数字がなく一様分布で計算した
};

/**
 * @brief 配置を逐次受け取って確率を合成する
 *
 * 配置 cfg（M = Σ m_i）の重み:
 *   w = k! / (Π m_i! · (k-M)!) · Π A(s_i, m_i) · A(n-S, k-M)
 * 残り k-M 個は外側領域に置かれる。M > k や外側に入りきらない場合は重み 0。
 * 重みは全て log 領域で扱い、最後に log-sum-exp で正規化する。
 */
class ProbabilityCombiner {
public:
    /**
     * @param layout グループ分割
     * @param per_cell 1セルあたりの最大地雷数
     * @param mines_remaining 残り地雷数 k
     * @param unclicked_count 未確定セル数 n（n >= S）
     * @param cache 組合せ計算のキャッシュ
     * @param tolerance [0, 1] からのはみ出しの許容値
     * @throws std::invalid_argument 引数の不整合
     * @throws NoSolutionError k が未確定セルの容量を超える
     */
    ProbabilityCombiner(const GroupLayout& layout, int per_cell, int mines_remaining,
                        int unclicked_count, CombinatoricsCache& cache,
                        double tolerance = 1e-4);

    /**
     * @brief 有効な配置を1つ追加
     */
    void add(const Configuration& cfg);

    /**
     * @brief 追加された配置の数
     */
    size_t configuration_count() const { return configuration_count_; }

    /**
     * @brief 確率を確定
     * @param outer_cells 外側領域のセル（n - S 個）
     * @throws NoSolutionError 配置がない、または全ての重みが 0
     * @throws InternalConsistencyError 確率・分布が許容範囲外
     */
    ProbabilityReport finish(const std::vector<Coord>& outer_cells) const;

private:
    double checked_probability(double value, const char* what) const;

    const GroupLayout& layout_;
    int per_cell_;
    int mines_;       // k
    int outer_size_;  // n - S
    CombinatoricsCache& cache_;
    double tolerance_;

    double log_k_factorial_ = 0.0;
    std::vector<std::vector<double>> group_terms_;  // [i][j] = log A(s_i, j) - log j!
    std::vector<double> outer_terms_;               // [M] = log A(n-S, k-M) - log (k-M)!

    std::vector<std::vector<double>> log_mass_;     // [i][j] = log Σ w (m_i = j)
    double log_total_;
    size_t configuration_count_ = 0;
    size_t weighted_count_ = 0;
};

} // namespace mine_prob

#endif // MINE_PROB_COMBINER_HPP
