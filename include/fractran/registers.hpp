/**
 * @file registers.hpp
 * @brief レジスタ集合（素数ごとの指数）
 */
#ifndef FRACTRAN_REGISTERS_HPP
#define FRACTRAN_REGISTERS_HPP

#include "fractran/fraction.hpp"
#include <map>
#include <string>
#include <vector>

namespace fractran {

/**
 * @brief レジスタ名（素数） -> 値（指数）
 */
using RegisterSet = std::map<Integer, Exponent>;

/**
 * @brief プログラムが使うレジスタ集合を取得
 *
 * 全分数の分子・分母に現れる素数の和集合。値はすべて 0。
 * 呼び出しごとに新しい集合を返す。
 */
RegisterSet program_registers(const Program& program);

/**
 * @brief 開始値を反映した初期レジスタ値
 *
 * program_registers() を 0 で初期化し、開始値の素因数分解で上書きする。
 * 開始値にしか現れない素数も（どの分数からも触られない）レジスタとして含む。
 */
RegisterSet initial_registers(const Program& program, const Integer& start);

/**
 * @brief レジスタ名を昇順で取得
 */
std::vector<Integer> register_names(const RegisterSet& registers);

/**
 * @brief "p1^e1 * p2^e2 * ..." 形式の文字列（値 0 のレジスタも含む）
 */
std::string register_set_to_string(const RegisterSet& registers);

} // namespace fractran

#endif // FRACTRAN_REGISTERS_HPP
