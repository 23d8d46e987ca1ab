/**
 * @file board.hpp
 * @brief 盤面スナップショット（セル内容の直和型と盤面インターフェース）
 */
#ifndef MINE_PROB_BOARD_HPP
#define MINE_PROB_BOARD_HPP

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace mine_prob {

/**
 * @brief 盤面上の座標 (x, y)
 *
 * (x, y) の辞書式順序で比較する。
 */
struct Coord {
    int x;
    int y;

    bool operator==(const Coord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
    bool operator<(const Coord& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }
};

/// 未クリックのセル
struct Unclicked {
    bool operator==(const Unclicked&) const { return true; }
};

/// 開いた数字セル
struct Num {
    int value;
    bool operator==(const Num& other) const { return value == other.value; }
};

/// 旗（k 個の地雷として確定扱い）
struct Flag {
    int count;
    bool operator==(const Flag& other) const { return count == other.count; }
};

/// 敗北後に表示された地雷
struct Mine {
    int count;
    bool operator==(const Mine& other) const { return count == other.count; }
};

/// 踏んだ地雷（ライフ制で踏んだ後もゲームが続く場合）
struct HitMine {
    int count;
    bool operator==(const HitMine& other) const { return count == other.count; }
};

/// 誤った旗（敗北後に表示）
struct WrongFlag {
    int count;
    bool operator==(const WrongFlag& other) const { return count == other.count; }
};

/**
 * @brief セル内容を表す直和型
 */
using CellContents = std::variant<Unclicked, Num, Flag, Mine, HitMine, WrongFlag>;

/**
 * @brief セル内容のテキスト表現（"#", "3", "F1", "M2", "!1", "X1"）
 */
std::string to_string(const CellContents& contents);

/**
 * @brief 盤面の読み取り専用インターフェース
 *
 * 確率エンジンはこのインターフェースだけを通して盤面を参照し、
 * 盤面を変更することはない。
 */
class BoardView {
public:
    virtual ~BoardView() = default;

    /**
     * @brief セル内容を取得
     * @throws std::out_of_range 盤面外の座標
     */
    virtual CellContents cell_contents(const Coord& coord) const = 0;

    /**
     * @brief 隣接セルの座標を取得（自身は含まない）
     */
    virtual std::vector<Coord> neighbors(const Coord& coord) const = 0;

    /**
     * @brief 全座標を辞書式順序で取得
     */
    virtual std::vector<Coord> all_coords() const = 0;
};

/**
 * @brief 矩形グリッドの盤面
 *
 * 隣接はチェビシェフ距離 detection 以内（detection = 1 で通常の8近傍）。
 * 全セルは Unclicked で初期化される。
 */
class Board : public BoardView {
public:
    /**
     * @brief 盤面を作成
     * @param x_size 列数
     * @param y_size 行数
     * @param detection 隣接半径
     * @throws std::invalid_argument サイズまたは半径が1未満
     */
    Board(int x_size, int y_size, int detection = 1);

    int x_size() const { return x_size_; }
    int y_size() const { return y_size_; }
    int detection() const { return detection_; }

    /**
     * @brief 座標が盤面内か
     */
    bool contains(const Coord& coord) const;

    /**
     * @brief セル内容を設定
     * @throws std::out_of_range 盤面外の座標
     */
    void set(const Coord& coord, CellContents contents);

    CellContents cell_contents(const Coord& coord) const override;
    std::vector<Coord> neighbors(const Coord& coord) const override;
    std::vector<Coord> all_coords() const override;

private:
    size_t index(const Coord& coord) const;

    int x_size_;
    int y_size_;
    int detection_;
    std::vector<CellContents> cells_;  // cells_[y * x_size_ + x]
};

} // namespace mine_prob

#endif // MINE_PROB_BOARD_HPP
