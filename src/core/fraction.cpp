#include "fractran/fraction.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace fractran {

Fraction::Fraction(Integer numerator, Integer denominator)
    : numerator_(std::move(numerator))
    , denominator_(std::move(denominator)) {
    if (sgn(numerator_) < 0) {
        throw ConfigurationError("Numerator " + numerator_.get_str() + " must not be negative");
    }
    if (sgn(denominator_) <= 0) {
        throw ConfigurationError("Denominator " + denominator_.get_str() + " must be positive");
    }
}

std::string Fraction::to_string() const {
    return numerator_.get_str() + "/" + denominator_.get_str();
}

Integer parse_integer(const std::string& text, const std::string& what) {
    size_t pos = 0;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        pos = 1;
    }
    bool digits = pos < text.size() &&
        std::all_of(text.begin() + pos, text.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        throw ConfigurationError(what + " " + text + " is not an integer");
    }

    // mpz_class は先頭の '+' を受け付けない
    Integer value;
    if (value.set_str(text[0] == '+' ? text.substr(1) : text, 10) != 0) {
        throw ConfigurationError(what + " " + text + " is not an integer");
    }
    return value;
}

size_t parse_step_limit(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw ConfigurationError("Invalid step limit: " + text);
    }
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (*end != '\0') {
        throw ConfigurationError("Invalid step limit: " + text);
    }
    // strtoul は範囲外を ULONG_MAX に丸める
    if (errno == ERANGE) {
        throw ConfigurationError("Step limit " + text + " is out of range");
    }
    return static_cast<size_t>(value);
}

Fraction make_fraction(const std::vector<std::string>& components) {
    if (components.size() != 2) {
        throw ConfigurationError("Each fraction must be a pair of integers, got "
                                 + std::to_string(components.size()) + " components");
    }
    return Fraction(parse_integer(components[0], "Numerator"),
                    parse_integer(components[1], "Denominator"));
}

Fraction parse_fraction(const std::string& text) {
    std::vector<std::string> components;
    size_t begin = 0;
    while (true) {
        size_t slash = text.find('/', begin);
        components.push_back(text.substr(begin, slash - begin));
        if (slash == std::string::npos) break;
        begin = slash + 1;
    }
    return make_fraction(components);
}

Program parse_program(const std::vector<std::string>& fractions) {
    Program program;
    program.reserve(fractions.size());
    for (const auto& text : fractions) {
        program.push_back(parse_fraction(text));
    }
    return program;
}

std::string fraction_label(size_t index) {
    // Excel の列名と同じ方式: 0 -> A, 25 -> Z, 26 -> AA
    std::string label;
    size_t n = index + 1;
    while (n > 0) {
        --n;
        label.insert(label.begin(), static_cast<char>('A' + n % 26));
        n /= 26;
    }
    return label;
}

} // namespace fractran
