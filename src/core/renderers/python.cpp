#include "fractran/renderer.hpp"

namespace fractran {

void PythonRenderer::render_prologue(CodeWriter& out, const RegisterProgram&) const {
    out.line("# Starting conditions");
    out.line("registers = {}");
}

void PythonRenderer::render_epilogue(CodeWriter&, const RegisterProgram&) const {}

void PythonRenderer::render_assign(CodeWriter& out, const AssignRegister& node,
                                   const RegisterProgram&) const {
    out.line("registers[" + node.reg.get_str() + "] = " + std::to_string(node.value));
}

void PythonRenderer::render_add(CodeWriter& out, const AddToRegister& node,
                                const RegisterProgram&) const {
    out.line("registers[" + node.reg.get_str() + "] += " + std::to_string(node.amount));
}

void PythonRenderer::render_subtract(CodeWriter& out, const SubtractFromRegister& node,
                                     const RegisterProgram&) const {
    out.line("registers[" + node.reg.get_str() + "] -= " + std::to_string(node.amount));
}

void PythonRenderer::render_clear(CodeWriter& out, const ClearRegisters&,
                                  const RegisterProgram&) const {
    // キーを残したまま 0 にする（表示に全レジスタを残すため）
    out.line("registers = dict.fromkeys(registers, 0)");
}

void PythonRenderer::render_print(CodeWriter& out, const PrintRegisters&,
                                  const RegisterProgram&) const {
    out.line("print(' * '.join(f'{p}^{v}' for p, v in registers.items()))");
}

void PythonRenderer::render_conditional(CodeWriter& out, const Conditional& node,
                                        const RegisterProgram& program) const {
    auto render_body = [&](const Block& body) {
        out.indent();
        if (body.empty()) {
            out.line("pass");
        } else {
            render_block(out, body, program);
        }
        out.dedent();
    };

    if (node.arms.empty()) {
        // 先頭の分数が常に適用可能なら分岐は不要
        if (node.otherwise_fraction) {
            out.line("# " + describe_fraction(program, *node.otherwise_fraction) + " always applies");
        }
        render_block(out, node.otherwise, program);
        return;
    }

    for (size_t i = 0; i < node.arms.size(); ++i) {
        const auto& arm = node.arms[i];
        std::string condition;
        for (const auto& g : arm.guard) {
            if (!condition.empty()) condition += " and ";
            condition += "(registers[" + g.reg.get_str() + "] >= " + std::to_string(g.at_least) + ")";
        }
        out.line(std::string(i == 0 ? "if " : "elif ") + condition + ":  # "
                 + describe_fraction(program, arm.fraction_index));
        render_body(arm.body);
    }

    if (node.otherwise_fraction) {
        out.line("else:  # " + describe_fraction(program, *node.otherwise_fraction));
    } else {
        out.line("else:  # halt");
    }
    render_body(node.otherwise);
}

void PythonRenderer::render_loop(CodeWriter& out, const Loop& node,
                                 const RegisterProgram& program) const {
    out.line("");
    out.line("# Main Loop");
    out.line("counter = 0");
    out.line("while sum(registers.values()) > 0:");
    out.indent();
    out.line("counter += 1");
    render_block(out, node.body, program);
    out.line("if counter > " + std::to_string(node.max_iterations) + ":");
    out.indent();
    out.line("break");
    out.dedent();
    out.dedent();
}

} // namespace fractran
