/**
 * @file engine.hpp
 * @brief 確率エンジン（抽出 → グループ化 → 列挙 → 合成）
 */
#ifndef MINE_PROB_ENGINE_HPP
#define MINE_PROB_ENGINE_HPP

#include "mine_prob/board.hpp"
#include "mine_prob/combiner.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <stdexcept>

namespace mine_prob {

/**
 * @brief エンジン統計情報（直近の呼び出し分）
 */
struct EngineStats {
    size_t constraint_count = 0;
    size_t group_count = 0;
    size_t edge_cell_count = 0;
    size_t outer_cell_count = 0;
    size_t branch_count = 0;
    size_t dead_end_count = 0;
    size_t configuration_count = 0;
    size_t combinatorics_rows = 0;
    bool used_uniform_fallback = false;
};

/**
 * @brief 地雷確率エンジン
 *
 * 呼び出しごとに盤面スナップショットを受け取り、新しい結果を返す。
 * 呼び出し間で共有する可変状態は設定と統計情報だけ。
 * 全ての失敗は例外で通知し、部分的な結果は返さない。
 */
class Engine {
public:
    Engine() = default;

    /**
     * @brief 全ての未確定セルの確率を計算
     * @param board 盤面
     * @param mines_remaining 残り地雷数（総数 - 旗の数）
     * @param per_cell 1セルあたりの最大地雷数
     * @return 座標 -> 確率
     * @throws std::invalid_argument mines_remaining < 0 または per_cell < 1
     * @throws MalformedBoardError 数字と旗が矛盾
     * @throws NoSolutionError 有効な配置がない
     * @throws SolverTimeoutError 予算超過・停止要求
     * @throws InternalConsistencyError 確率が範囲外
     */
    ProbabilityMap compute(const BoardView& board, int mines_remaining, int per_cell);

    /**
     * @brief compute() と同じ計算を行い、グループ分布なども含めて返す
     */
    ProbabilityReport solve(const BoardView& board, int mines_remaining, int per_cell);

    /**
     * @brief 統計情報を取得
     */
    const EngineStats& stats() const { return stats_; }

    /**
     * @brief 列挙する配置数の上限（0 = 無制限）
     */
    void set_max_configurations(size_t limit) { max_configurations_ = limit; }
    size_t max_configurations() const { return max_configurations_; }

    /**
     * @brief 列挙の制限時間（0 = 無制限）
     */
    void set_time_limit(std::chrono::milliseconds limit) { time_limit_ = limit; }
    std::chrono::milliseconds time_limit() const { return time_limit_; }

    /**
     * @brief 旗を未確定セルとして扱う
     *
     * 旗の地雷数は残り地雷数に戻される。
     */
    void set_ignore_flags(bool enabled) { ignore_flags_ = enabled; }
    bool ignore_flags() const { return ignore_flags_; }

    /**
     * @brief 確率が [0, 1] からはみ出してよい幅
     * @throws std::invalid_argument 負の値
     */
    void set_tolerance(double tolerance) {
        if (!(tolerance >= 0.0)) {
            throw std::invalid_argument("Tolerance must be non-negative");
        }
        tolerance_ = tolerance;
    }
    double tolerance() const { return tolerance_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 列挙を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

private:
    /**
     * @brief 数字がない盤面: 全セル一様
     */
    ProbabilityReport solve_uniform(const std::vector<Coord>& unknown, int mines, int per_cell,
                                    CombinatoricsCache& cache);

    // 設定
    size_t max_configurations_ = 1000000;
    std::chrono::milliseconds time_limit_{0};
    bool ignore_flags_ = false;
    double tolerance_ = 1e-4;
    bool verbose_ = false;

    std::atomic<bool> stopped_{false};
    EngineStats stats_;
};

/**
 * @brief 既定設定のエンジンで確率を計算
 */
ProbabilityMap compute_probabilities(const BoardView& board, int mines_remaining, int per_cell);

} // namespace mine_prob

#endif // MINE_PROB_ENGINE_HPP
