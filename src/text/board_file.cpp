#include "mine_prob/text/board_file.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace mine_prob {
namespace text {

void BoardFile::add_row(std::vector<CellContents> row) {
    if (row.empty()) {
        throw std::runtime_error("Row " + std::to_string(rows_.size() + 1) + " is empty");
    }
    if (!rows_.empty() && row.size() != rows_.front().size()) {
        throw std::runtime_error("Row " + std::to_string(rows_.size() + 1) + " has " +
                                 std::to_string(row.size()) + " cells, expected " +
                                 std::to_string(rows_.front().size()));
    }
    rows_.push_back(std::move(row));
}

Board BoardFile::to_board(std::optional<int> detection_override) const {
    if (rows_.empty()) {
        throw std::runtime_error("Board has no rows");
    }
    int radius = detection_override ? *detection_override : detection.value_or(1);
    Board board(x_size(), y_size(), radius);
    for (int y = 0; y < y_size(); ++y) {
        for (int x = 0; x < x_size(); ++x) {
            board.set(Coord{x, y}, rows_[y][x]);
        }
    }
    return board;
}

int BoardFile::pinned_mine_count() const {
    int count = 0;
    for (const auto& row : rows_) {
        for (const auto& cell : row) {
            if (auto* flag = std::get_if<Flag>(&cell)) {
                count += flag->count;
            } else if (auto* wrong = std::get_if<WrongFlag>(&cell)) {
                count += wrong->count;
            } else if (auto* hit = std::get_if<HitMine>(&cell)) {
                count += hit->count;
            }
        }
    }
    return count;
}

int BoardFile::mines_remaining(int total) const {
    int pinned = pinned_mine_count();
    if (pinned > total) {
        throw std::runtime_error("Board pins " + std::to_string(pinned) +
                                 " mines but only " + std::to_string(total) + " exist");
    }
    return total - pinned;
}

int BoardFile::mines_remaining() const {
    if (!mines) {
        throw std::runtime_error("Total mine count is not given (use 'mines:' or -m)");
    }
    return mines_remaining(*mines);
}

} // namespace text
} // namespace mine_prob
