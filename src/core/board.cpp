#include "mine_prob/board.hpp"
#include <algorithm>
#include <stdexcept>

namespace mine_prob {

namespace {
struct ContentsFormatter {
    std::string operator()(const Unclicked&) const { return "#"; }
    std::string operator()(const Num& n) const { return std::to_string(n.value); }
    std::string operator()(const Flag& f) const { return "F" + std::to_string(f.count); }
    std::string operator()(const Mine& m) const { return "M" + std::to_string(m.count); }
    std::string operator()(const HitMine& h) const { return "!" + std::to_string(h.count); }
    std::string operator()(const WrongFlag& w) const { return "X" + std::to_string(w.count); }
};
}  // namespace

std::string to_string(const CellContents& contents) {
    return std::visit(ContentsFormatter{}, contents);
}

Board::Board(int x_size, int y_size, int detection)
    : x_size_(x_size)
    , y_size_(y_size)
    , detection_(detection) {
    if (x_size < 1 || y_size < 1) {
        throw std::invalid_argument("Board dimensions must be positive: " +
                                    std::to_string(x_size) + "x" + std::to_string(y_size));
    }
    if (detection < 1) {
        throw std::invalid_argument("Detection radius must be at least 1: " +
                                    std::to_string(detection));
    }
    cells_.assign(static_cast<size_t>(x_size) * static_cast<size_t>(y_size), Unclicked{});
}

bool Board::contains(const Coord& coord) const {
    return coord.x >= 0 && coord.y >= 0 && coord.x < x_size_ && coord.y < y_size_;
}

size_t Board::index(const Coord& coord) const {
    if (!contains(coord)) {
        throw std::out_of_range("Coordinate out of range: (" + std::to_string(coord.x) +
                                ", " + std::to_string(coord.y) + ")");
    }
    return static_cast<size_t>(coord.y) * static_cast<size_t>(x_size_) +
           static_cast<size_t>(coord.x);
}

void Board::set(const Coord& coord, CellContents contents) {
    cells_[index(coord)] = std::move(contents);
}

CellContents Board::cell_contents(const Coord& coord) const {
    return cells_[index(coord)];
}

std::vector<Coord> Board::neighbors(const Coord& coord) const {
    std::vector<Coord> result;
    int x_lo = std::max(0, coord.x - detection_);
    int x_hi = std::min(x_size_ - 1, coord.x + detection_);
    int y_lo = std::max(0, coord.y - detection_);
    int y_hi = std::min(y_size_ - 1, coord.y + detection_);
    // (x, y) の辞書式順序で列挙
    for (int x = x_lo; x <= x_hi; ++x) {
        for (int y = y_lo; y <= y_hi; ++y) {
            if (x == coord.x && y == coord.y) continue;
            result.push_back(Coord{x, y});
        }
    }
    return result;
}

std::vector<Coord> Board::all_coords() const {
    std::vector<Coord> result;
    result.reserve(cells_.size());
    for (int x = 0; x < x_size_; ++x) {
        for (int y = 0; y < y_size_; ++y) {
            result.push_back(Coord{x, y});
        }
    }
    return result;
}

} // namespace mine_prob
