#include "fractran/frac/source.hpp"
#include "fractran/engine.hpp"
#include "fractran/register_program.hpp"
#include "fractran/registers.hpp"
#include "fractran/renderer.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cctype>
#include <utility>
#include <optional>
#include <vector>
#include <sys/stat.h>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file.frac | fraction...>\n";
    std::cerr << "  -n START  Starting value (overrides 'start' in the file, default 2)\n";
    std::cerr << "  -m MAX    Maximum number of steps (default 100)\n";
    std::cerr << "  -v        Verbose mode (print applied fractions)\n";
    std::cerr << "  -vv       Very verbose mode (print every attempted fraction)\n";
    std::cerr << "  -s        Print run statistics to stderr\n";
    std::cerr << "  -q        Do not print the trace\n";
    std::cerr << "  -r        Print the registers used by the program\n";
    std::cerr << "  -p LANG   Print the equivalent register program (python, cpp) instead of running\n";
}

bool g_print_stats = false;

void print_stats(const fractran::Engine& engine) {
    if (!g_print_stats) return;
    const auto& trace = engine.trace();
    std::cerr << "% Stats: steps=" << trace.steps()
              << " halt=\"" << fractran::to_string(trace.halt_reason()) << "\""
              << " final=" << trace.last_live_state()
              << " fires=";
    auto counts = trace.fire_counts(engine.program().size());
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << fractran::fraction_label(i) << ":" << counts[i];
    }
    std::cerr << "\n";
}

void print_registers(const fractran::Program& program) {
    auto registers = fractran::program_registers(program);
    std::cout << "Registers (" << registers.size() << "):";
    for (const auto& name : fractran::register_names(registers)) {
        std::cout << " " << name;
    }
    std::cout << "\n";
}

bool file_exists(const char* path) {
    struct stat st;
    return ::stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

/**
 * @brief 位置引数からプログラムと開始値を読み込む
 *
 * 引数が1つで既存のファイルなら .frac ファイル、それ以外は "n/d" の並びとみなす。
 */
std::pair<fractran::Program, fractran::Integer> load_program(const std::vector<std::string>& args) {
    if (args.size() == 1 && file_exists(args[0].c_str())) {
        auto source = fractran::frac::parse_file(args[0]);
        return {source.to_program(), source.start_value()};
    }
    return {fractran::parse_program(args), fractran::Integer(2)};
}

int main(int argc, char* argv[]) {
    std::optional<std::string> start_text;
    size_t max_steps = fractran::Engine::DEFAULT_MAX_STEPS;
    fractran::Verbosity verbosity = fractran::Verbosity::Silent;
    bool quiet = false;
    bool show_registers = false;
    std::optional<std::string> language;
    std::vector<std::string> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            start_text = argv[++i];
        } else if (std::strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            try {
                max_steps = fractran::parse_step_limit(argv[++i]);
            } catch (const fractran::ConfigurationError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbosity = fractran::Verbosity::Success;
        } else if (std::strcmp(argv[i], "-vv") == 0) {
            verbosity = fractran::Verbosity::Attempts;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-q") == 0) {
            quiet = true;
        } else if (std::strcmp(argv[i], "-r") == 0) {
            show_registers = true;
        } else if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            language = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' || std::isdigit(static_cast<unsigned char>(argv[i][1]))) {
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto [program, start] = load_program(positional);
        if (start_text) {
            start = fractran::parse_integer(*start_text, "Starting value");
        }

        if (show_registers) {
            print_registers(program);
        }

        if (language) {
            auto renderer = fractran::make_renderer(*language);
            if (!renderer) {
                std::cerr << "Unknown language: " << *language << "\n";
                return 1;
            }
            std::cout << renderer->render(fractran::synthesize(program, start, max_steps));
            return 0;
        }

        fractran::Engine engine(std::move(program), start);
        engine.run(std::nullopt, verbosity, max_steps);
        if (!quiet) {
            std::cout << engine << "\n";
        }
        print_stats(engine);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
