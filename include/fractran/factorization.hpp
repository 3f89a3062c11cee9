/**
 * @file factorization.hpp
 * @brief 素因数分解（試し割り）
 */
#ifndef FRACTRAN_FACTORIZATION_HPP
#define FRACTRAN_FACTORIZATION_HPP

#include "fractran/integer.hpp"
#include <map>
#include <string>
#include <ostream>

namespace fractran {

/**
 * @brief 素因数分解の結果（素数 -> 指数）
 *
 * n = ∏ prime^exponent を表す。空のマップは n = 1 を表す。
 * 構築後は変更しない値オブジェクト。素数は昇順に並ぶ。
 */
class PrimeFactorization {
public:
    using map_type = std::map<Integer, Exponent>;
    using const_iterator = map_type::const_iterator;

    /**
     * @brief 空の分解（n = 1）
     */
    PrimeFactorization() = default;

    /**
     * @brief 素数 -> 指数のマップから作成
     * @note 指数 0 の要素は取り除く
     */
    explicit PrimeFactorization(map_type factors);

    bool empty() const { return factors_.empty(); }
    size_t size() const { return factors_.size(); }

    const_iterator begin() const { return factors_.begin(); }
    const_iterator end() const { return factors_.end(); }

    /**
     * @brief 素数 prime の指数を取得（含まれなければ 0）
     */
    Exponent exponent(const Integer& prime) const;

    /**
     * @brief 素数 prime を因数に持つか
     */
    bool contains(const Integer& prime) const { return factors_.count(prime) > 0; }

    /**
     * @brief 内部マップへの参照を取得
     */
    const map_type& factors() const { return factors_; }

    /**
     * @brief 積 ∏ prime^exponent を計算（元の n を復元）
     */
    Integer value() const;

    /**
     * @brief "p1^e1 * p2^e2 * ..." 形式の文字列
     *
     * 空の分解は空積として "1" を返す。
     */
    std::string to_string() const;

    bool operator==(const PrimeFactorization& other) const { return factors_ == other.factors_; }
    bool operator!=(const PrimeFactorization& other) const { return !(*this == other); }

private:
    map_type factors_;
};

/**
 * @brief 非負整数を素因数分解
 *
 * 2 から √n まで試し割りし、残りが 1 より大きければ
 * それを指数 1 の素数として記録する。
 * n = 0, 1 は空の分解を返す。
 *
 * @param n 分解する値
 * @return 分解結果（毎回新しい値）
 * @throws std::invalid_argument n が負の場合
 */
PrimeFactorization factorize(const Integer& n);

std::ostream& operator<<(std::ostream& os, const PrimeFactorization& factorization);

} // namespace fractran

#endif // FRACTRAN_FACTORIZATION_HPP
