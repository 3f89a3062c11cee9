#include "fractran/register_program.hpp"
#include "fractran/factorization.hpp"

namespace fractran {

namespace {

/**
 * @brief 分数1つ分の更新（分母を減算、分子を加算）
 */
Block fraction_updates(const Fraction& fraction) {
    Block body;
    if (fraction.is_zero()) {
        body.push_back(Statement{ClearRegisters{}});
        return body;
    }
    for (const auto& [prime, exp] : factorize(fraction.denominator())) {
        body.push_back(Statement{SubtractFromRegister{prime, exp}});
    }
    for (const auto& [prime, exp] : factorize(fraction.numerator())) {
        body.push_back(Statement{AddToRegister{prime, exp}});
    }
    return body;
}

std::vector<GuardCondition> fraction_guard(const Fraction& fraction) {
    std::vector<GuardCondition> guard;
    for (const auto& [prime, exp] : factorize(fraction.denominator())) {
        guard.push_back(GuardCondition{prime, exp});
    }
    return guard;
}

} // namespace

RegisterProgram synthesize(const Program& program, const Integer& start,
                           size_t max_iterations) {
    if (sgn(start) <= 0) {
        throw ConfigurationError("Starting value " + start.get_str() + " must be a positive integer");
    }

    RegisterProgram result;
    result.program = program;
    result.start = start;
    result.registers = program_registers(program);
    result.initial = initial_registers(program, start);

    for (const auto& [reg, value] : result.initial) {
        result.statements.push_back(Statement{AssignRegister{reg, value}});
    }

    Conditional conditional;
    for (size_t i = 0; i < program.size(); ++i) {
        const auto& fraction = program[i];
        // 分子 0 は常に状態を 0 にし、分母 1 は常に割り切れる
        if (fraction.is_zero() || fraction.is_integral()) {
            conditional.otherwise_fraction = i;
            conditional.otherwise = fraction_updates(fraction);
            for (size_t j = i + 1; j < program.size(); ++j) {
                result.unreachable.push_back(j);
            }
            break;
        }
        conditional.arms.push_back(ConditionalArm{i, fraction_guard(fraction), fraction_updates(fraction)});
    }
    if (!conditional.otherwise_fraction) {
        conditional.otherwise.push_back(Statement{ClearRegisters{}});
    }

    Loop loop;
    loop.max_iterations = max_iterations;
    loop.body.push_back(Statement{std::move(conditional)});
    loop.body.push_back(Statement{PrintRegisters{}});
    result.statements.push_back(Statement{std::move(loop)});

    return result;
}

} // namespace fractran
