#include "mine_prob/group.hpp"
#include <algorithm>
#include <cstdint>
#include <map>

namespace mine_prob {

GroupLayout find_groups(const std::vector<NumberConstraint>& constraints, int per_cell) {
    // 逆引き: 未確定セル -> 隣接する制約 ID
    // 制約を ID 順に走査するので各リストは昇順になる
    std::map<Coord, std::vector<size_t>> cell_constraints;
    for (const auto& nc : constraints) {
        for (const auto& cell : nc.unclicked_neighbors) {
            cell_constraints[cell].push_back(nc.id);
        }
    }

    // 制約 ID 集合でバケット化（セルは座標順に追加される）
    std::map<std::vector<size_t>, std::vector<Coord>> buckets;
    for (const auto& [cell, ids] : cell_constraints) {
        buckets[ids].push_back(cell);
    }

    GroupLayout layout;
    layout.groups.reserve(buckets.size());
    for (auto& [ids, coords] : buckets) {
        int min_residual = constraints[ids.front()].residual;
        for (size_t id : ids) {
            min_residual = std::min(min_residual, constraints[id].residual);
        }
        int64_t capacity = static_cast<int64_t>(coords.size()) * per_cell;

        EquivalenceGroup group;
        group.id = 0;  // 並べ替え後に振る
        group.constraint_ids = ids;
        group.max_mines = static_cast<int>(std::min<int64_t>(capacity, min_residual));
        group.coords = std::move(coords);
        layout.edge_cell_count += group.coords.size();
        layout.groups.push_back(std::move(group));
    }

    // 最小座標の昇順（出力の再現性のため）
    std::sort(layout.groups.begin(), layout.groups.end(),
              [](const EquivalenceGroup& a, const EquivalenceGroup& b) {
                  return a.coords.front() < b.coords.front();
              });

    layout.constraint_groups.assign(constraints.size(), {});
    for (size_t i = 0; i < layout.groups.size(); ++i) {
        layout.groups[i].id = i;
        for (size_t c : layout.groups[i].constraint_ids) {
            layout.constraint_groups[c].push_back(i);
        }
    }
    return layout;
}

} // namespace mine_prob
