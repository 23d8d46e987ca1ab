/**
 * @file group.hpp
 * @brief 同値グループ（同じ数字集合に隣接するセルの集まり）
 */
#ifndef MINE_PROB_GROUP_HPP
#define MINE_PROB_GROUP_HPP

#include "mine_prob/constraint.hpp"
#include <cstddef>
#include <vector>

namespace mine_prob {

/**
 * @brief 同値グループ
 *
 * 隣接する数字制約の集合が完全に一致するセルは同じグループに属する。
 * グループ内のセルは対称なので、確率は全セル共通になる。
 */
struct EquivalenceGroup {
    size_t id;                          ///< GroupLayout::groups 内のインデックス
    std::vector<Coord> coords;          ///< 所属セル（昇順）
    std::vector<size_t> constraint_ids; ///< 隣接する数字制約（昇順）
    int max_mines;                      ///< min(|coords| * per_cell, 隣接数字の最小 residual)

    size_t size() const { return coords.size(); }
};

/**
 * @brief グループ分割の結果
 */
struct GroupLayout {
    /// 最小座標の昇順に並んだグループ
    std::vector<EquivalenceGroup> groups;

    /// constraint_groups[c] = 数字制約 c に隣接するグループ ID（昇順）
    std::vector<std::vector<size_t>> constraint_groups;

    /// 境界セル数 S（全グループのサイズの和）
    size_t edge_cell_count = 0;
};

/**
 * @brief 数字制約から同値グループを構築
 *
 * セル -> 隣接制約 ID 集合 の逆引きを1回の走査で作り、その集合で
 * セルをまとめる。どの数字にも隣接しないセルは含まれない（外側領域）。
 *
 * @param constraints extract_constraints() の結果
 * @param per_cell 1セルあたりの最大地雷数
 */
GroupLayout find_groups(const std::vector<NumberConstraint>& constraints, int per_cell);

} // namespace mine_prob

#endif // MINE_PROB_GROUP_HPP
