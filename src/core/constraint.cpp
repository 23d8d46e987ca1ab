#include "mine_prob/constraint.hpp"
#include "mine_prob/errors.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mine_prob {

namespace {
// 全ての選択肢を列挙すること（抜けるとコンパイルエラーになる）
struct RoleVisitor {
    bool ignore_flags;

    CellRole operator()(const Unclicked&) const { return CellRole::Unknown; }
    CellRole operator()(const Num&) const { return CellRole::Number; }
    CellRole operator()(const Flag&) const {
        return ignore_flags ? CellRole::Unknown : CellRole::Pinned;
    }
    CellRole operator()(const WrongFlag&) const {
        return ignore_flags ? CellRole::Unknown : CellRole::Pinned;
    }
    CellRole operator()(const Mine&) const { return CellRole::Unknown; }
    CellRole operator()(const HitMine&) const { return CellRole::Pinned; }
};

struct PinnedCountVisitor {
    int operator()(const Flag& f) const { return f.count; }
    int operator()(const WrongFlag& w) const { return w.count; }
    int operator()(const HitMine& h) const { return h.count; }
    template <typename T>
    int operator()(const T&) const { return 0; }
};

std::string coord_str(const Coord& c) {
    return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}
}  // namespace

CellRole classify(const CellContents& contents, bool ignore_flags) {
    return std::visit(RoleVisitor{ignore_flags}, contents);
}

int pinned_mines(const CellContents& contents, bool ignore_flags) {
    if (classify(contents, ignore_flags) != CellRole::Pinned) {
        return 0;
    }
    return std::visit(PinnedCountVisitor{}, contents);
}

std::vector<NumberConstraint> extract_constraints(const BoardView& board, int per_cell,
                                                  bool ignore_flags) {
    if (per_cell < 1) {
        throw std::invalid_argument("per_cell must be at least 1: " + std::to_string(per_cell));
    }

    std::vector<NumberConstraint> result;
    for (const auto& coord : board.all_coords()) {
        auto contents = board.cell_contents(coord);
        if (classify(contents, ignore_flags) != CellRole::Number) continue;
        int shown = std::get<Num>(contents).value;
        if (shown == 0) continue;

        int residual = shown;
        std::vector<Coord> unknown;
        for (const auto& nb : board.neighbors(coord)) {
            auto nb_contents = board.cell_contents(nb);
            switch (classify(nb_contents, ignore_flags)) {
                case CellRole::Unknown:
                    unknown.push_back(nb);
                    break;
                case CellRole::Pinned:
                    residual -= pinned_mines(nb_contents, ignore_flags);
                    break;
                case CellRole::Number:
                    break;
            }
        }

        if (residual < 0) {
            throw MalformedBoardError("Number " + std::to_string(shown) + " in cell " +
                                      coord_str(coord) + " has more flags than its value");
        }
        if (static_cast<int64_t>(residual) >
            static_cast<int64_t>(unknown.size()) * per_cell) {
            throw MalformedBoardError("Number " + std::to_string(shown) + " in cell " +
                                      coord_str(coord) + " is too high for its " +
                                      std::to_string(unknown.size()) + " unclicked neighbours");
        }
        if (unknown.empty()) continue;

        std::sort(unknown.begin(), unknown.end());
        NumberConstraint nc;
        nc.id = result.size();
        nc.coord = coord;
        nc.residual = residual;
        nc.unclicked_neighbors = std::move(unknown);
        result.push_back(std::move(nc));
    }
    return result;
}

} // namespace mine_prob
