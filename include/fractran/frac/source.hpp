/**
 * @file source.hpp
 * @brief .frac プログラムファイルの中間表現
 */
#ifndef FRACTRAN_FRAC_SOURCE_HPP
#define FRACTRAN_FRAC_SOURCE_HPP

#include "fractran/fraction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fractran {
namespace frac {

/**
 * @brief 分数宣言（検証前のテキスト）
 */
struct FractionDecl {
    std::vector<std::string> components;  // 通常は (分子, 分母) の2要素
    int line = 0;
};

/**
 * @brief start 宣言
 */
struct StartDecl {
    std::string value;
    int line = 0;
};

/**
 * @brief .frac ファイルの内容
 */
class Source {
public:
    Source() = default;

    /**
     * @brief 分数宣言を追加
     */
    void add_fraction_decl(FractionDecl decl);

    /**
     * @brief start 宣言を設定（後の宣言が優先）
     */
    void set_start_decl(StartDecl decl);

    const std::vector<FractionDecl>& fraction_decls() const { return fraction_decls_; }
    const std::optional<StartDecl>& start_decl() const { return start_decl_; }

    /**
     * @brief 検証済みのプログラムに変換
     * @throws ConfigurationError 成分が整数でない場合など（行番号付き）
     */
    Program to_program() const;

    /**
     * @brief 開始値を取得（宣言がなければ 2）
     * @throws ConfigurationError 開始値が正の整数でない場合
     */
    Integer start_value() const;

private:
    std::vector<FractionDecl> fraction_decls_;
    std::optional<StartDecl> start_decl_;
};

/**
 * @brief .frac ファイルをパース
 * @param filename ファイル名
 * @return パースされた内容
 * @throws ConfigurationError ファイルが開けない、または構文エラー時
 */
Source parse_file(const std::string& filename);

/**
 * @brief .frac 文字列をパース
 * @param input 入力文字列
 * @return パースされた内容
 * @throws ConfigurationError 構文エラー時
 */
Source parse_string(const std::string& input);

} // namespace frac
} // namespace fractran

#endif // FRACTRAN_FRAC_SOURCE_HPP
