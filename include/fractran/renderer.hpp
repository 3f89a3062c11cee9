/**
 * @file renderer.hpp
 * @brief レジスタマシンプログラムのソースコード出力（言語ごとに差し替え可能）
 */
#ifndef FRACTRAN_RENDERER_HPP
#define FRACTRAN_RENDERER_HPP

#include "fractran/register_program.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fractran {

/**
 * @brief インデント付きの行バッファ
 */
class CodeWriter {
public:
    explicit CodeWriter(std::string indent_unit);

    /**
     * @brief 現在のインデントで1行追加（空文字列なら空行）
     */
    void line(const std::string& text);

    void indent() { ++depth_; }
    void dedent();

    std::string str() const;

private:
    std::string indent_unit_;
    size_t depth_ = 0;
    std::vector<std::string> lines_;
};

/**
 * @brief 出力言語の基底クラス
 *
 * render() が構文木を辿り、ノードごとの仮想関数を呼び出す。
 * 派生クラスは各ノードの表記だけを定義する。
 */
class CodeRenderer {
public:
    virtual ~CodeRenderer() = default;

    /**
     * @brief 出力言語名（"python" など）
     */
    virtual std::string language() const = 0;

    /**
     * @brief プログラム全体をソースコードにする（実行はしない）
     */
    std::string render(const RegisterProgram& program) const;

protected:
    virtual std::string indent_unit() const { return "    "; }

    virtual void render_prologue(CodeWriter& out, const RegisterProgram& program) const = 0;
    virtual void render_epilogue(CodeWriter& out, const RegisterProgram& program) const = 0;

    virtual void render_assign(CodeWriter& out, const AssignRegister& node,
                               const RegisterProgram& program) const = 0;
    virtual void render_add(CodeWriter& out, const AddToRegister& node,
                            const RegisterProgram& program) const = 0;
    virtual void render_subtract(CodeWriter& out, const SubtractFromRegister& node,
                                 const RegisterProgram& program) const = 0;
    virtual void render_clear(CodeWriter& out, const ClearRegisters& node,
                              const RegisterProgram& program) const = 0;
    virtual void render_print(CodeWriter& out, const PrintRegisters& node,
                              const RegisterProgram& program) const = 0;
    virtual void render_conditional(CodeWriter& out, const Conditional& node,
                                    const RegisterProgram& program) const = 0;
    virtual void render_loop(CodeWriter& out, const Loop& node,
                             const RegisterProgram& program) const = 0;

    /**
     * @brief 文の列を出力（派生クラスの分岐・ループから呼ぶ）
     */
    void render_block(CodeWriter& out, const Block& block, const RegisterProgram& program) const;

    /**
     * @brief 分数のコメント用表記 "fraction A (17/91)"
     */
    static std::string describe_fraction(const RegisterProgram& program, size_t index);
};

/**
 * @brief Python 3 で出力
 */
class PythonRenderer : public CodeRenderer {
public:
    std::string language() const override { return "python"; }

protected:
    void render_prologue(CodeWriter& out, const RegisterProgram& program) const override;
    void render_epilogue(CodeWriter& out, const RegisterProgram& program) const override;
    void render_assign(CodeWriter& out, const AssignRegister& node,
                       const RegisterProgram& program) const override;
    void render_add(CodeWriter& out, const AddToRegister& node,
                    const RegisterProgram& program) const override;
    void render_subtract(CodeWriter& out, const SubtractFromRegister& node,
                         const RegisterProgram& program) const override;
    void render_clear(CodeWriter& out, const ClearRegisters& node,
                      const RegisterProgram& program) const override;
    void render_print(CodeWriter& out, const PrintRegisters& node,
                      const RegisterProgram& program) const override;
    void render_conditional(CodeWriter& out, const Conditional& node,
                            const RegisterProgram& program) const override;
    void render_loop(CodeWriter& out, const Loop& node,
                     const RegisterProgram& program) const override;
};

/**
 * @brief 単体でコンパイルできる C++17 プログラムとして出力
 *
 * レジスタは素数 p ごとに変数 rp（unsigned long）とする。
 */
class CppRenderer : public CodeRenderer {
public:
    std::string language() const override { return "cpp"; }

protected:
    void render_prologue(CodeWriter& out, const RegisterProgram& program) const override;
    void render_epilogue(CodeWriter& out, const RegisterProgram& program) const override;
    void render_assign(CodeWriter& out, const AssignRegister& node,
                       const RegisterProgram& program) const override;
    void render_add(CodeWriter& out, const AddToRegister& node,
                    const RegisterProgram& program) const override;
    void render_subtract(CodeWriter& out, const SubtractFromRegister& node,
                         const RegisterProgram& program) const override;
    void render_clear(CodeWriter& out, const ClearRegisters& node,
                      const RegisterProgram& program) const override;
    void render_print(CodeWriter& out, const PrintRegisters& node,
                      const RegisterProgram& program) const override;
    void render_conditional(CodeWriter& out, const Conditional& node,
                            const RegisterProgram& program) const override;
    void render_loop(CodeWriter& out, const Loop& node,
                     const RegisterProgram& program) const override;

private:
    static std::string reg(const Integer& prime);
};

/**
 * @brief 言語名から出力器を作成
 * @param language "python" または "cpp"
 * @return 未対応の言語なら nullptr
 */
std::unique_ptr<CodeRenderer> make_renderer(const std::string& language);

} // namespace fractran

#endif // FRACTRAN_RENDERER_HPP
