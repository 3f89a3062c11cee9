#include "fractran/renderer.hpp"
#include <sstream>
#include <stdexcept>

namespace fractran {

// ============================================================================
// CodeWriter
// ============================================================================

CodeWriter::CodeWriter(std::string indent_unit)
    : indent_unit_(std::move(indent_unit)) {}

void CodeWriter::line(const std::string& text) {
    if (text.empty()) {
        lines_.emplace_back();
        return;
    }
    std::string indented;
    for (size_t i = 0; i < depth_; ++i) {
        indented += indent_unit_;
    }
    lines_.push_back(indented + text);
}

void CodeWriter::dedent() {
    if (depth_ == 0) {
        throw std::logic_error("CodeWriter::dedent() at depth 0");
    }
    --depth_;
}

std::string CodeWriter::str() const {
    std::ostringstream oss;
    for (const auto& l : lines_) {
        oss << l << "\n";
    }
    return oss.str();
}

// ============================================================================
// CodeRenderer
// ============================================================================

std::string CodeRenderer::render(const RegisterProgram& program) const {
    CodeWriter out(indent_unit());
    render_prologue(out, program);
    render_block(out, program.statements, program);
    render_epilogue(out, program);
    return out.str();
}

void CodeRenderer::render_block(CodeWriter& out, const Block& block,
                                const RegisterProgram& program) const {
    for (const auto& stmt : block) {
        const auto& node = stmt.node;
        if (auto* n = std::get_if<AssignRegister>(&node)) {
            render_assign(out, *n, program);
        } else if (auto* n = std::get_if<AddToRegister>(&node)) {
            render_add(out, *n, program);
        } else if (auto* n = std::get_if<SubtractFromRegister>(&node)) {
            render_subtract(out, *n, program);
        } else if (auto* n = std::get_if<ClearRegisters>(&node)) {
            render_clear(out, *n, program);
        } else if (auto* n = std::get_if<PrintRegisters>(&node)) {
            render_print(out, *n, program);
        } else if (auto* n = std::get_if<Conditional>(&node)) {
            render_conditional(out, *n, program);
        } else if (auto* n = std::get_if<Loop>(&node)) {
            render_loop(out, *n, program);
        }
    }
}

std::string CodeRenderer::describe_fraction(const RegisterProgram& program, size_t index) {
    return "fraction " + fraction_label(index) + " (" + program.program.at(index).to_string() + ")";
}

std::unique_ptr<CodeRenderer> make_renderer(const std::string& language) {
    if (language == "python" || language == "py") {
        return std::make_unique<PythonRenderer>();
    }
    if (language == "cpp" || language == "c++") {
        return std::make_unique<CppRenderer>();
    }
    return nullptr;
}

} // namespace fractran
