/**
 * @file constraint.hpp
 * @brief 数字セルの制約（残り地雷数と未確定の隣接セル）の抽出
 */
#ifndef MINE_PROB_CONSTRAINT_HPP
#define MINE_PROB_CONSTRAINT_HPP

#include "mine_prob/board.hpp"
#include <cstddef>
#include <vector>

namespace mine_prob {

/**
 * @brief 数字セル1つ分の制約
 *
 * residual = 表示数字 - 隣接する旗で確定済みの地雷数。
 * 不変条件: 0 <= residual <= unclicked_neighbors.size() * per_cell
 */
struct NumberConstraint {
    size_t id;                              ///< extract_constraints() の戻り値内のインデックス
    Coord coord;                            ///< 数字セルの座標
    int residual;                           ///< 残り地雷数
    std::vector<Coord> unclicked_neighbors; ///< 未確定の隣接セル（昇順）
};

/**
 * @brief セル内容をソルバーから見た分類
 */
enum class CellRole {
    Unknown,  // 地雷の有無が未確定（確率を計算する対象）
    Number,   // 数字
    Pinned    // 確定済みの地雷（旗など）
};

/**
 * @brief セル内容の分類
 *
 * Mine は敗北表示前の状態（未確定）として、HitMine は確定地雷として扱う。
 * ignore_flags のとき Flag / WrongFlag は未確定セルになる。
 */
CellRole classify(const CellContents& contents, bool ignore_flags);

/**
 * @brief 確定済み地雷の数（Pinned 以外は 0）
 */
int pinned_mines(const CellContents& contents, bool ignore_flags);

/**
 * @brief 盤面から数字制約を抽出
 *
 * all_coords() の順に1回だけ走査する。
 * - Num(0) は対象外（隣接セルは上流で安全と確定済み）
 * - residual が 0 で未確定の隣接セルがない数字は情報がないので対象外
 *
 * @param board 盤面
 * @param per_cell 1セルあたりの最大地雷数
 * @param ignore_flags 旗を未確定セルとして扱うか
 * @throws MalformedBoardError residual が負、または容量を超える
 */
std::vector<NumberConstraint> extract_constraints(const BoardView& board, int per_cell,
                                                  bool ignore_flags = false);

} // namespace mine_prob

#endif // MINE_PROB_CONSTRAINT_HPP
