/**
 * @file board_file.hpp
 * @brief テキスト盤面ファイルの中間表現
 */
#ifndef MINE_PROB_TEXT_BOARD_FILE_HPP
#define MINE_PROB_TEXT_BOARD_FILE_HPP

#include "mine_prob/board.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mine_prob {
namespace text {

/**
 * @brief 盤面ファイルの内容
 *
 * rows()[y][x] がセル (x, y) に対応する。
 */
class BoardFile {
public:
    BoardFile() = default;

    // ディレクティブ（省略可）
    std::optional<int> mines;      ///< 盤面全体の地雷数
    std::optional<int> per_cell;   ///< 1セルあたりの最大地雷数
    std::optional<int> detection;  ///< 隣接半径

    /**
     * @brief 行を追加
     * @throws std::runtime_error 既存の行と幅が異なる
     */
    void add_row(std::vector<CellContents> row);

    const std::vector<std::vector<CellContents>>& rows() const { return rows_; }
    int x_size() const { return rows_.empty() ? 0 : static_cast<int>(rows_.front().size()); }
    int y_size() const { return static_cast<int>(rows_.size()); }

    /**
     * @brief Board を構築
     * @param detection_override 指定時はファイルの detection より優先
     * @throws std::runtime_error 行がない
     */
    Board to_board(std::optional<int> detection_override = std::nullopt) const;

    /**
     * @brief 旗・踏んだ地雷を除いた残り地雷数
     * @param total 全地雷数
     * @throws std::runtime_error 確定済みの地雷が total を超える
     */
    int mines_remaining(int total) const;

    /**
     * @brief ファイルの mines ディレクティブから残り地雷数を計算
     * @throws std::runtime_error mines が指定されていない
     */
    int mines_remaining() const;

    /**
     * @brief 旗・誤った旗・踏んだ地雷が確定させている地雷の合計
     */
    int pinned_mine_count() const;

private:
    std::vector<std::vector<CellContents>> rows_;
};

/**
 * @brief 盤面ファイルを読み込む
 * @throws std::runtime_error ファイルが開けない、または構文エラー
 */
BoardFile parse_file(const std::string& filename);

/**
 * @brief 文字列から盤面を読み込む
 * @throws std::runtime_error 構文エラー
 */
BoardFile parse_string(const std::string& input);

} // namespace text
} // namespace mine_prob

#endif // MINE_PROB_TEXT_BOARD_FILE_HPP
