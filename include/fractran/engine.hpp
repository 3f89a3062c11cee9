/**
 * @file engine.hpp
 * @brief FRACTRAN実行エンジン（線形スキャンによる逐次実行と履歴）
 */
#ifndef FRACTRAN_ENGINE_HPP
#define FRACTRAN_ENGINE_HPP

#include "fractran/fraction.hpp"
#include "fractran/factorization.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fractran {

/**
 * @brief 診断出力のレベル
 */
enum class Verbosity {
    Silent,    // 出力なし
    Success,   // 適用された分数のみ
    Attempts   // 試行した全ての分数
};

/**
 * @brief 停止理由
 *
 * トレース上はいずれも状態 0 で表されるが、自然停止と
 * ステップ上限による打ち切りを区別できるようにする。
 */
enum class HaltReason {
    Running,               // 未停止
    NoApplicableFraction,  // どの分数も整数にならない
    ZeroNumerator,         // 分子 0 の分数が適用され状態が 0 になった
    StepLimit              // ステップ上限に達した
};

/**
 * @brief 停止理由の表示名
 */
const char* to_string(HaltReason reason);

class Engine;  // forward declaration

/**
 * @brief 実行履歴
 *
 * states()[i] から states()[i + 1] への遷移で適用された分数の
 * インデックスが transitions()[i]。停止時の 0 には遷移が対応しない
 * （分子 0 の分数で 0 になった場合を除く）。
 * 追記のみで、書き換えは Engine からしか行わない。
 */
class Trace {
public:
    explicit Trace(Integer start);

    const std::vector<Integer>& states() const { return states_; }
    const std::vector<size_t>& transitions() const { return transitions_; }

    /**
     * @brief 状態数（開始値を含む）
     */
    size_t size() const { return states_.size(); }

    /**
     * @brief 適用された分数の数
     */
    size_t steps() const { return transitions_.size(); }

    /**
     * @brief 最新の状態
     */
    const Integer& back() const { return states_.back(); }

    /**
     * @brief 最後の 0 でない状態（停止した位置）
     */
    const Integer& last_live_state() const;

    bool halted() const { return halt_reason_ != HaltReason::Running; }
    HaltReason halt_reason() const { return halt_reason_; }

    /**
     * @brief 分数ごとの適用回数
     * @param program_size プログラムの分数の数
     */
    std::vector<size_t> fire_counts(size_t program_size) const;

private:
    friend class Engine;

    void push_transition(Integer next, size_t fraction_index);
    void push_halt(HaltReason reason);

    std::vector<Integer> states_;
    std::vector<size_t> transitions_;
    HaltReason halt_reason_ = HaltReason::Running;
};

/**
 * @brief FRACTRANプログラムの実行エンジン
 *
 * 分数を先頭から走査し、状態との積が整数になる最初の分数を適用する。
 * 単一スレッドでの使用を前提とし、同じインスタンスを並行に
 * 操作することは呼び出し側の責任で避けること。
 */
class Engine {
public:
    static constexpr size_t DEFAULT_MAX_STEPS = 100;

    /**
     * @brief エンジンを作成
     * @param program 分数列（以後変更しない）
     * @param start 開始値（正の整数）
     * @throws ConfigurationError 開始値が正でない場合
     */
    explicit Engine(Program program, Integer start = 2);

    const Program& program() const { return program_; }
    const Trace& trace() const { return trace_; }

    /**
     * @brief 1ステップ実行
     *
     * 最初に (numerator * N) % denominator == 0 となる分数を適用して
     * 新しい状態を追記する。該当がなければ 0 を追記して停止する。
     *
     * @throws std::logic_error 既に停止している場合
     */
    void step(Verbosity verbosity = Verbosity::Silent);

    /**
     * @brief 停止するまで実行
     *
     * 停止するか、トレース長が max_steps を超えそうになったら
     * 0 を追記して打ち切る。停止済みのトレースは延長しない。
     *
     * @param start 指定した場合はトレースをこの値から作り直す
     * @param verbosity 診断出力レベル
     * @param max_steps ステップ上限
     * @return 最後の 0 でない状態
     * @throws ConfigurationError start が正でない場合（トレースは変更しない）
     */
    Integer run(const std::optional<Integer>& start = std::nullopt,
                Verbosity verbosity = Verbosity::Silent,
                size_t max_steps = DEFAULT_MAX_STEPS);

    /**
     * @brief 診断出力先を設定（デフォルトは std::cerr）
     */
    void set_log_stream(std::ostream* os) { log_ = os; }

    /**
     * @brief 履歴を1状態1行で表示
     *
     * 各状態の素因数分解と、適用した分数・ラベルを出力する。
     */
    std::string to_string() const;

private:
    static const Integer& validate_start(const Integer& start);

    Program program_;
    Trace trace_;
    std::ostream* log_ = &std::cerr;
};

std::ostream& operator<<(std::ostream& os, const Engine& engine);

} // namespace fractran

#endif // FRACTRAN_ENGINE_HPP
