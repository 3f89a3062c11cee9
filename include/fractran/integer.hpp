/**
 * @file integer.hpp
 * @brief 多倍長整数型（GMP mpz_class）
 */
#ifndef FRACTRAN_INTEGER_HPP
#define FRACTRAN_INTEGER_HPP

#include <gmpxx.h>

namespace fractran {

/**
 * @brief 状態値・分子・分母・素数に使う多倍長整数
 *
 * FRACTRAN の状態は素数冪の積として際限なく大きくなるため、
 * 固定長整数は使わない。
 */
using Integer = mpz_class;

/**
 * @brief 指数・レジスタ値の型（mpz_pow_ui の引数型に合わせる）
 */
using Exponent = unsigned long;

} // namespace fractran

#endif // FRACTRAN_INTEGER_HPP
