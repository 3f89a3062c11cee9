#include "fractran/frac/source.hpp"

namespace fractran {
namespace frac {

void Source::add_fraction_decl(FractionDecl decl) {
    fraction_decls_.push_back(std::move(decl));
}

void Source::set_start_decl(StartDecl decl) {
    start_decl_ = std::move(decl);
}

Program Source::to_program() const {
    Program program;
    program.reserve(fraction_decls_.size());
    for (const auto& decl : fraction_decls_) {
        try {
            program.push_back(make_fraction(decl.components));
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("line " + std::to_string(decl.line) + ": " + e.what());
        }
    }
    return program;
}

Integer Source::start_value() const {
    if (!start_decl_) {
        return Integer(2);
    }
    Integer value;
    try {
        value = parse_integer(start_decl_->value, "Starting value");
    } catch (const ConfigurationError& e) {
        throw ConfigurationError("line " + std::to_string(start_decl_->line) + ": " + e.what());
    }
    if (sgn(value) <= 0) {
        throw ConfigurationError("line " + std::to_string(start_decl_->line)
                                 + ": Starting value " + value.get_str() + " must be a positive integer");
    }
    return value;
}

} // namespace frac
} // namespace fractran
