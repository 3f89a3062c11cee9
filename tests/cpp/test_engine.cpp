#include <catch2/catch.hpp>
#include "fractran/engine.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace fractran;

namespace {

// Conway's PRIMEGAME
Program primegame() {
    return parse_program({"17/91", "78/85", "19/51", "23/38", "29/33", "77/29", "95/23",
                          "77/19", "1/17", "11/13", "13/11", "15/2", "1/7", "55/1"});
}

std::vector<Integer> to_integers(const std::vector<long>& values) {
    return std::vector<Integer>(values.begin(), values.end());
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Engine construction", "[engine]") {
    SECTION("default starting value is 2") {
        Engine engine(primegame());
        REQUIRE(engine.trace().size() == 1);
        REQUIRE(engine.trace().back() == 2);
        REQUIRE_FALSE(engine.trace().halted());
        REQUIRE(engine.trace().halt_reason() == HaltReason::Running);
    }

    SECTION("non-positive starting value") {
        REQUIRE_THROWS_AS(Engine(primegame(), 0), ConfigurationError);
        REQUIRE_THROWS_AS(Engine(primegame(), -4), ConfigurationError);
    }

    SECTION("non-integer starting value text") {
        REQUIRE_THROWS_AS(Engine(primegame(), parse_integer("2.5", "Starting value")),
                          ConfigurationError);
    }

    SECTION("fraction that is not an integer pair") {
        REQUIRE_THROWS_AS(Engine(parse_program({"1/2", "3.5/2"})), ConfigurationError);
        REQUIRE_THROWS_AS(Engine(parse_program({"1/2", "3"})), ConfigurationError);
    }
}

// ============================================================================
// step
// ============================================================================

TEST_CASE("Engine step applies the first divisible fraction", "[engine][step]") {
    // 3/2 と 5/1 はどちらも適用可能だが先頭が優先
    Engine engine(parse_program({"7/3", "3/2", "5/1"}), 4);

    engine.step();
    REQUIRE(engine.trace().size() == 2);
    REQUIRE(engine.trace().back() == 6);
    REQUIRE(engine.trace().transitions() == std::vector<size_t>{1});

    engine.step();
    REQUIRE(engine.trace().size() == 3);
    REQUIRE(engine.trace().back() == 14);
    REQUIRE(engine.trace().transitions() == std::vector<size_t>{1, 0});
}

TEST_CASE("Engine step appends 0 when nothing applies", "[engine][step]") {
    Engine engine(parse_program({"1/2"}), 3);
    engine.step();

    REQUIRE(engine.trace().states() == to_integers({3, 0}));
    REQUIRE(engine.trace().transitions().empty());
    REQUIRE(engine.trace().halted());
    REQUIRE(engine.trace().halt_reason() == HaltReason::NoApplicableFraction);
}

TEST_CASE("Engine step on a halted trace is an error", "[engine][step]") {
    Engine engine(parse_program({"1/2"}), 3);
    engine.step();
    REQUIRE_THROWS_AS(engine.step(), std::logic_error);
    REQUIRE(engine.trace().size() == 2);
}

TEST_CASE("Engine step uses exact divisibility of the product", "[engine][step]") {
    // 既約でない 2/4 は 2 * 2 = 4 が 4 で割り切れるので適用される
    Engine engine(parse_program({"2/4"}), 2);
    engine.step();
    REQUIRE(engine.trace().back() == 1);
    REQUIRE(engine.trace().transitions() == std::vector<size_t>{0});
}

TEST_CASE("Engine zero numerator halts the machine", "[engine][step]") {
    Engine engine(parse_program({"0/5", "3/2"}), 2);
    const auto result = engine.run();

    REQUIRE(engine.trace().states() == to_integers({2, 0}));
    REQUIRE(engine.trace().transitions() == std::vector<size_t>{0});
    REQUIRE(engine.trace().halt_reason() == HaltReason::ZeroNumerator);
    REQUIRE(result == 2);
}

// ============================================================================
// run
// ============================================================================

TEST_CASE("Engine run PRIMEGAME matches the published sequence", "[engine][run]") {
    Engine engine(primegame(), 2);
    engine.run(std::nullopt, Verbosity::Silent, 20);

    const auto expected = to_integers({2, 15, 825, 725, 1925, 2275, 425, 390, 330, 290,
                                       770, 910, 170, 156, 132, 116, 308, 364, 68, 4});
    const auto& states = engine.trace().states();
    REQUIRE(states.size() == expected.size() + 1);
    for (size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(states[i] == expected[i]);
    }
    REQUIRE(states.back() == 0);
    REQUIRE(engine.trace().halt_reason() == HaltReason::StepLimit);
    REQUIRE(engine.trace().transitions() ==
            std::vector<size_t>{11, 13, 4, 5, 10, 0, 1, 9, 4, 5, 10, 0, 1, 9, 4, 5, 10, 0, 8});
}

TEST_CASE("Engine run halts naturally", "[engine][run]") {
    Engine engine(parse_program({"1/2"}), 8);
    const auto result = engine.run();

    REQUIRE(engine.trace().states() == to_integers({8, 4, 2, 1, 0}));
    REQUIRE(engine.trace().transitions() == std::vector<size_t>{0, 0, 0});
    REQUIRE(engine.trace().steps() == 3);
    REQUIRE(engine.trace().halt_reason() == HaltReason::NoApplicableFraction);
    REQUIRE(result == 1);
}

TEST_CASE("Engine run result survives a later reset", "[engine][run]") {
    Engine engine(parse_program({"3/2"}), 8);
    const Integer result = engine.run();
    REQUIRE(result == 27);

    engine.run(Integer(1024));
    REQUIRE(engine.trace().last_live_state() == 59049);
    REQUIRE(result == 27);
}

TEST_CASE("Engine halted state is absorbing", "[engine][run]") {
    Engine engine(parse_program({"1/2"}), 8);
    engine.run();
    REQUIRE(engine.trace().size() == 5);

    engine.run();
    REQUIRE(engine.trace().size() == 5);
    REQUIRE(engine.trace().back() == 0);
}

TEST_CASE("Engine run with a new starting value resets the trace", "[engine][run]") {
    Engine engine(parse_program({"1/2"}), 8);
    engine.run();

    engine.run(Integer(16));
    REQUIRE(engine.trace().states() == to_integers({16, 8, 4, 2, 1, 0}));

    SECTION("invalid starting value leaves the trace untouched") {
        REQUIRE_THROWS_AS(engine.run(Integer(0)), ConfigurationError);
        REQUIRE(engine.trace().states() == to_integers({16, 8, 4, 2, 1, 0}));
    }
}

TEST_CASE("Engine denominator 1 is an unconditional fallback", "[engine][run]") {
    Engine engine(parse_program({"3/2", "1/1"}), 4);
    engine.run(std::nullopt, Verbosity::Silent, 10);

    const auto& states = engine.trace().states();
    REQUIRE(states.size() == 11);
    for (size_t i = 0; i + 1 < states.size(); ++i) {
        REQUIRE(states[i] != 0);
    }
    REQUIRE(states.back() == 0);
    REQUIRE(engine.trace().halt_reason() == HaltReason::StepLimit);

    // 4 -> 6 -> 9 の後は 1/1 のみが適用される
    const auto& transitions = engine.trace().transitions();
    REQUIRE(transitions[0] == 0);
    REQUIRE(transitions[1] == 0);
    for (size_t i = 2; i < transitions.size(); ++i) {
        REQUIRE(transitions[i] == 1);
    }
}

TEST_CASE("Engine step limit and natural halt never stack", "[engine][run]") {
    // 自然停止がちょうど上限と重なっても 0 は1つだけ
    Engine engine(parse_program({"1/2"}), 8);
    engine.run(std::nullopt, Verbosity::Silent, 5);

    REQUIRE(engine.trace().states() == to_integers({8, 4, 2, 1, 0}));
    REQUIRE(engine.trace().halt_reason() == HaltReason::NoApplicableFraction);

    SECTION("one step less is reported as a step limit") {
        Engine capped(parse_program({"1/2"}), 8);
        capped.run(std::nullopt, Verbosity::Silent, 4);
        REQUIRE(capped.trace().states() == to_integers({8, 4, 2, 1, 0}));
        REQUIRE(capped.trace().halt_reason() == HaltReason::StepLimit);
    }
}

TEST_CASE("Engine run with states beyond 64 bits", "[engine][run]") {
    Integer start;
    mpz_ui_pow_ui(start.get_mpz_t(), 2, 100);

    Engine engine(parse_program({"3/2"}), start);
    const auto result = engine.run(std::nullopt, Verbosity::Silent, 1000);

    Integer expected;
    mpz_ui_pow_ui(expected.get_mpz_t(), 3, 100);
    REQUIRE(result == expected);
    REQUIRE(engine.trace().steps() == 100);
    REQUIRE(engine.trace().halt_reason() == HaltReason::NoApplicableFraction);
}

TEST_CASE("Trace fire counts", "[engine][trace]") {
    Engine engine(parse_program({"3/2", "5/3"}), 4);
    engine.run();

    // 4 -> 6 -> 9 -> 15 -> 25
    REQUIRE(engine.trace().fire_counts(2) == std::vector<size_t>{2, 2});
    REQUIRE(engine.trace().last_live_state() == 25);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_CASE("Engine verbosity levels", "[engine][log]") {
    std::ostringstream log;
    Engine engine(parse_program({"3/5", "1/2"}), 8);
    engine.set_log_stream(&log);

    SECTION("silent") {
        engine.run();
        REQUIRE(log.str().empty());
    }

    SECTION("success only") {
        engine.step(Verbosity::Success);
        REQUIRE(log.str() == "% [verbose] N_1 = 1/2 * 8 = 4 = 2^2\n");
    }

    SECTION("every attempt") {
        engine.step(Verbosity::Attempts);
        REQUIRE(log.str() ==
                "% [verbose] trying 3/5 * 8\n"
                "% [verbose] trying 1/2 * 8\n"
                "% [verbose] N_1 = 1/2 * 8 = 4 = 2^2\n");
    }
}

// ============================================================================
// Display
// ============================================================================

TEST_CASE("Engine trace rendering", "[engine][display]") {
    SECTION("natural halt") {
        Engine engine(parse_program({"1/2"}), 8);
        engine.run();
        REQUIRE(engine.to_string() ==
                "2^3\n"
                "*1/2 (A)\n"
                "2^2\n"
                "*1/2 (A)\n"
                "2^1\n"
                "*1/2 (A)\n"
                "1\n"
                "0 (halted: no applicable fraction)");
    }

    SECTION("step limit") {
        Engine engine(primegame(), 2);
        engine.run(std::nullopt, Verbosity::Silent, 3);
        std::ostringstream oss;
        oss << engine;
        REQUIRE(oss.str() ==
                "2^1\n"
                "*15/2 (L)\n"
                "3^1 * 5^1\n"
                "*55/1 (N)\n"
                "3^1 * 5^2 * 11^1\n"
                "0 (halted: step limit)");
    }
}
