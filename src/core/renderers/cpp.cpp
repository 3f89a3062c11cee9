#include "fractran/renderer.hpp"

namespace fractran {

std::string CppRenderer::reg(const Integer& prime) {
    return "r" + prime.get_str();
}

void CppRenderer::render_prologue(CodeWriter& out, const RegisterProgram&) const {
    out.line("#include <iostream>");
    out.line("");
    out.line("int main() {");
    out.indent();
    out.line("// Starting conditions");
}

void CppRenderer::render_epilogue(CodeWriter& out, const RegisterProgram&) const {
    out.line("return 0;");
    out.dedent();
    out.line("}");
}

void CppRenderer::render_assign(CodeWriter& out, const AssignRegister& node,
                                const RegisterProgram&) const {
    out.line("unsigned long " + reg(node.reg) + " = " + std::to_string(node.value) + ";");
}

void CppRenderer::render_add(CodeWriter& out, const AddToRegister& node,
                             const RegisterProgram&) const {
    out.line(reg(node.reg) + " += " + std::to_string(node.amount) + ";");
}

void CppRenderer::render_subtract(CodeWriter& out, const SubtractFromRegister& node,
                                  const RegisterProgram&) const {
    out.line(reg(node.reg) + " -= " + std::to_string(node.amount) + ";");
}

void CppRenderer::render_clear(CodeWriter& out, const ClearRegisters&,
                               const RegisterProgram& program) const {
    for (const auto& [prime, value] : program.initial) {
        (void)value;
        out.line(reg(prime) + " = 0;");
    }
}

void CppRenderer::render_print(CodeWriter& out, const PrintRegisters&,
                               const RegisterProgram& program) const {
    std::string text = "std::cout";
    bool first = true;
    for (const auto& [prime, value] : program.initial) {
        (void)value;
        text += " << \"" + std::string(first ? "" : " * ") + prime.get_str() + "^\" << " + reg(prime);
        first = false;
    }
    out.line(text + " << '\\n';");
}

void CppRenderer::render_conditional(CodeWriter& out, const Conditional& node,
                                     const RegisterProgram& program) const {
    if (node.arms.empty()) {
        if (node.otherwise_fraction) {
            out.line("// " + describe_fraction(program, *node.otherwise_fraction) + " always applies");
        }
        render_block(out, node.otherwise, program);
        return;
    }

    for (size_t i = 0; i < node.arms.size(); ++i) {
        const auto& arm = node.arms[i];
        std::string condition;
        for (const auto& g : arm.guard) {
            if (!condition.empty()) condition += " && ";
            condition += reg(g.reg) + " >= " + std::to_string(g.at_least);
        }
        out.line(std::string(i == 0 ? "if (" : "} else if (") + condition + ") {  // "
                 + describe_fraction(program, arm.fraction_index));
        out.indent();
        render_block(out, arm.body, program);
        out.dedent();
    }

    if (node.otherwise_fraction) {
        out.line("} else {  // " + describe_fraction(program, *node.otherwise_fraction));
    } else {
        out.line("} else {  // halt");
    }
    out.indent();
    render_block(out, node.otherwise, program);
    out.dedent();
    out.line("}");
}

void CppRenderer::render_loop(CodeWriter& out, const Loop& node,
                              const RegisterProgram& program) const {
    std::string condition;
    for (const auto& [prime, value] : program.initial) {
        (void)value;
        if (!condition.empty()) condition += " || ";
        condition += reg(prime) + " != 0";
    }
    if (condition.empty()) {
        condition = "false";
    }

    out.line("");
    out.line("// Main loop");
    out.line("unsigned long counter = 0;");
    out.line("while (" + condition + ") {");
    out.indent();
    out.line("++counter;");
    render_block(out, node.body, program);
    out.line("if (counter > " + std::to_string(node.max_iterations) + ") {");
    out.indent();
    out.line("break;");
    out.dedent();
    out.line("}");
    out.dedent();
    out.line("}");
}

} // namespace fractran
