/**
 * @file errors.hpp
 * @brief 確率エンジンの例外クラス
 */
#ifndef MINE_PROB_ERRORS_HPP
#define MINE_PROB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mine_prob {

/**
 * @brief 数字の残り地雷数が負、または隣接セルの容量を超えている
 *
 * 盤面を作った側（ゲームエンジン）の不具合を示す。リトライしない。
 */
class MalformedBoardError : public std::runtime_error {
public:
    explicit MalformedBoardError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief 制約を満たす配置が1つも存在しない（盤面が自己矛盾している）
 */
class NoSolutionError : public std::runtime_error {
public:
    explicit NoSolutionError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief 列挙の予算（配置数・時間）を超えた、または停止要求を受けた
 *
 * 呼び出し側は予算を増やして再試行するか、確率表示を諦める。
 */
class SolverTimeoutError : public std::runtime_error {
public:
    explicit SolverTimeoutError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief 計算した確率が [0, 1] から許容誤差を超えて外れた（実装の不具合）
 */
class InternalConsistencyError : public std::runtime_error {
public:
    explicit InternalConsistencyError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace mine_prob

#endif // MINE_PROB_ERRORS_HPP
