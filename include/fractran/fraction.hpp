/**
 * @file fraction.hpp
 * @brief 分数とFRACTRANプログラム、入力検証
 */
#ifndef FRACTRAN_FRACTION_HPP
#define FRACTRAN_FRACTION_HPP

#include "fractran/integer.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace fractran {

/**
 * @brief 入力（開始値・分数）の不正を表す例外
 *
 * 構築時に即座に送出される。内部で回復・再試行はしない。
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 分数（分子 >= 0、分母 > 0）
 *
 * 既約であるかは検証しない。既約でない分数はどの分数が先に
 * 適用されるかを変え得るため、既約化は呼び出し側の責任とする。
 */
class Fraction {
public:
    /**
     * @brief 分数を作成
     * @throws ConfigurationError 分子が負、または分母が正でない場合
     */
    Fraction(Integer numerator, Integer denominator);

    const Integer& numerator() const { return numerator_; }
    const Integer& denominator() const { return denominator_; }

    /**
     * @brief 分母が 1 か（常に適用可能）
     */
    bool is_integral() const { return denominator_ == 1; }

    /**
     * @brief 分子が 0 か（適用すると状態が 0 になる）
     */
    bool is_zero() const { return sgn(numerator_) == 0; }

    /**
     * @brief "n/d" 形式の文字列
     */
    std::string to_string() const;

    bool operator==(const Fraction& other) const {
        return numerator_ == other.numerator_ && denominator_ == other.denominator_;
    }
    bool operator!=(const Fraction& other) const { return !(*this == other); }

private:
    Integer numerator_;
    Integer denominator_;
};

/**
 * @brief FRACTRANプログラム（順序が優先度を決める）
 */
using Program = std::vector<Fraction>;

/**
 * @brief 10進整数テキストを解釈
 * @param text 入力文字列（前後の空白は許容しない）
 * @param what エラーメッセージ用の項目名（"Numerator" など）
 * @throws ConfigurationError 整数でない場合（"2.5" など）
 */
Integer parse_integer(const std::string& text, const std::string& what);

/**
 * @brief ステップ上限のテキストを解釈
 * @throws ConfigurationError 非負の10進数でない場合、または unsigned long に収まらない場合
 */
size_t parse_step_limit(const std::string& text);

/**
 * @brief 成分リストから分数を作成
 * @param components 2要素（分子、分母）であること
 * @throws ConfigurationError 2要素でない、または成分が整数でない場合
 */
Fraction make_fraction(const std::vector<std::string>& components);

/**
 * @brief "n/d" 形式のテキストから分数を作成
 */
Fraction parse_fraction(const std::string& text);

/**
 * @brief "n/d" テキストのリストからプログラムを作成
 */
Program parse_program(const std::vector<std::string>& fractions);

/**
 * @brief 分数の位置ラベル（A, B, ..., Z, AA, AB, ...）
 */
std::string fraction_label(size_t index);

} // namespace fractran

#endif // FRACTRAN_FRACTION_HPP
