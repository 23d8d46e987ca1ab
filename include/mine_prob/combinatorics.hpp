/**
 * @file combinatorics.hpp
 * @brief 地雷配置数の計算と単一セルの危険確率
 *
 * 地雷は全て区別可能として数える（配置数と重み計算で一貫させる）。
 */
#ifndef MINE_PROB_COMBINATORICS_HPP
#define MINE_PROB_COMBINATORICS_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace mine_prob {

/**
 * @brief 組合せ計算のメモ化テーブル
 *
 * 呼び出しごと（または明示的に注入して）使う。プロセス全体で共有する
 * 状態は持たない。
 *
 * - log 階乗テーブル
 * - per_cell ごとの漸化式テーブル
 *   A(c, m) = Σ_{j=0..min(p, m)} C(m, j) · A(c-1, m-j)
 *   を log 領域で保持する（行 c は m = 0..min(c·p, mines_cap)）
 */
class CombinatoricsCache {
public:
    CombinatoricsCache() = default;

    /**
     * @brief log(n!) を取得
     */
    double log_factorial(int n);

    /**
     * @brief log C(n, k) を取得
     */
    double log_binomial(int n, int k);

    /**
     * @brief 漸化式テーブルから log A(cells, mines) を取得
     *
     * 1 < per_cell < mines の一般ケース用。
     * mines が既存テーブルの上限を超えた場合はテーブルを作り直す。
     */
    double bounded_log_count(int cells, int mines, int per_cell);

    /**
     * @brief 保持しているテーブル行数の合計（テスト・統計用）
     */
    size_t table_rows() const;

    /**
     * @brief 全テーブルを破棄
     */
    void clear();

private:
    struct BoundedTable {
        int mines_cap = -1;
        std::vector<std::vector<double>> rows;
    };

    std::vector<double> log_factorials_{0.0};
    std::map<int, BoundedTable> bounded_tables_;
};

/**
 * @brief log(exp(a) + exp(b)) を桁あふれなしで計算（-infinity は 0 を表す）
 */
double log_add(double a, double b);

/**
 * @brief mines 個の地雷を cells 個のセルに置く配置数（1セル最大 per_cell 個）
 *
 * 厳密な整数値を返す。64 bit に収まらない場合は例外。
 * エンジン本体は log_arrangement_count() を使う。
 *
 * @throws std::invalid_argument 負の値、または per_cell < 1
 * @throws std::overflow_error 結果が uint64_t に収まらない
 */
uint64_t arrangement_count(int cells, int mines, int per_cell);

/**
 * @brief arrangement_count() の自然対数
 * @return 配置数が 0 なら -infinity
 * @throws std::invalid_argument 負の値、または per_cell < 1
 */
double log_arrangement_count(int cells, int mines, int per_cell, CombinatoricsCache& cache);

/**
 * @brief 一様ランダムな配置で特定の1セルに地雷が1個以上ある確率
 *
 * 一般ケースは log 領域の比 1 - exp(log A(c-1, m) - log A(c, m)) で計算し、
 * 大きな整数同士の割り算はしない。
 *
 * @throws std::invalid_argument mines > cells * per_cell、cells < 1 など
 */
double unsafe_probability(int cells, int mines, int per_cell, CombinatoricsCache& cache);

/**
 * @brief unsafe_probability()（一時キャッシュ版）
 */
double unsafe_probability(int cells, int mines, int per_cell);

} // namespace mine_prob

#endif // MINE_PROB_COMBINATORICS_HPP
