#include "fractran/registers.hpp"
#include "fractran/factorization.hpp"
#include <sstream>

namespace fractran {

RegisterSet program_registers(const Program& program) {
    RegisterSet registers;
    for (const auto& fraction : program) {
        for (const auto& [prime, exp] : factorize(fraction.numerator())) {
            (void)exp;
            registers[prime] = 0;
        }
        for (const auto& [prime, exp] : factorize(fraction.denominator())) {
            (void)exp;
            registers[prime] = 0;
        }
    }
    return registers;
}

RegisterSet initial_registers(const Program& program, const Integer& start) {
    RegisterSet registers = program_registers(program);
    for (const auto& [prime, exp] : factorize(start)) {
        registers[prime] = exp;
    }
    return registers;
}

std::vector<Integer> register_names(const RegisterSet& registers) {
    std::vector<Integer> names;
    names.reserve(registers.size());
    for (const auto& [prime, value] : registers) {
        (void)value;
        names.push_back(prime);
    }
    return names;
}

std::string register_set_to_string(const RegisterSet& registers) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [prime, value] : registers) {
        if (!first) oss << " * ";
        first = false;
        oss << prime.get_str() << "^" << value;
    }
    return oss.str();
}

} // namespace fractran
