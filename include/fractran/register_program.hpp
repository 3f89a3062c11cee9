/**
 * @file register_program.hpp
 * @brief FRACTRANプログラムと等価なレジスタマシンプログラム（構文木）
 */
#ifndef FRACTRAN_REGISTER_PROGRAM_HPP
#define FRACTRAN_REGISTER_PROGRAM_HPP

#include "fractran/fraction.hpp"
#include "fractran/registers.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace fractran {

struct Statement;

/**
 * @brief 文の列
 */
using Block = std::vector<Statement>;

/**
 * @brief reg = value
 */
struct AssignRegister {
    Integer reg;
    Exponent value;
};

/**
 * @brief reg += amount（分子の素因数）
 */
struct AddToRegister {
    Integer reg;
    Exponent amount;
};

/**
 * @brief reg -= amount（分母の素因数）
 */
struct SubtractFromRegister {
    Integer reg;
    Exponent amount;
};

/**
 * @brief 全レジスタを 0 にする（停止）
 */
struct ClearRegisters {};

/**
 * @brief 全レジスタを "p^e * ..." 形式で出力
 */
struct PrintRegisters {};

/**
 * @brief ガード条件 reg >= at_least
 */
struct GuardCondition {
    Integer reg;
    Exponent at_least;
};

/**
 * @brief 条件分岐の1つの枝（1つの分数に対応）
 */
struct ConditionalArm {
    size_t fraction_index;
    std::vector<GuardCondition> guard;  // 全て満たすときに適用
    Block body;
};

/**
 * @brief 優先順位付きの条件分岐（if / elif ... / else）
 *
 * arms を先頭から評価し最初に成立した枝を実行する。
 * どれも成立しなければ otherwise を実行する。
 */
struct Conditional {
    std::vector<ConditionalArm> arms;
    std::optional<size_t> otherwise_fraction;  // else に割り当てた分数（なければ停止）
    Block otherwise;
};

/**
 * @brief いずれかのレジスタが 0 でない間、最大 max_iterations 回繰り返す
 */
struct Loop {
    size_t max_iterations;
    Block body;
};

/**
 * @brief 文（構文木のノード）
 */
struct Statement {
    using Node = std::variant<
        AssignRegister,
        AddToRegister,
        SubtractFromRegister,
        ClearRegisters,
        PrintRegisters,
        Conditional,
        Loop
    >;
    Node node;
};

/**
 * @brief 合成されたレジスタマシンプログラム
 */
struct RegisterProgram {
    Program program;
    Integer start;
    RegisterSet registers;              // プログラムが使うレジスタ（値は 0）
    RegisterSet initial;                // 開始値を反映した初期値
    std::vector<size_t> unreachable;    // 常に適用可能な分数より後ろの分数
    Block statements;
};

/**
 * @brief FRACTRANプログラムをレジスタマシンプログラムに変換
 *
 * 各分数の分母をガード、分母の指数を減算、分子の指数を加算とする
 * 条件分岐を分数の順に並べる。分子 0 または分母 1 の分数は常に
 * 適用可能なので else 枝とし、それ以降の分数は出力しない。
 * 生成のみを行い、生成したプログラムは実行しない。
 *
 * @param program 分数列
 * @param start 開始値（正の整数）
 * @param max_iterations ループ回数の上限
 * @throws ConfigurationError start が正でない場合
 */
RegisterProgram synthesize(const Program& program, const Integer& start,
                           size_t max_iterations = 100);

} // namespace fractran

#endif // FRACTRAN_REGISTER_PROGRAM_HPP
