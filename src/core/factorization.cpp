#include "fractran/factorization.hpp"
#include <stdexcept>
#include <sstream>

namespace fractran {

PrimeFactorization::PrimeFactorization(map_type factors)
    : factors_(std::move(factors)) {
    for (auto it = factors_.begin(); it != factors_.end();) {
        if (it->second == 0) {
            it = factors_.erase(it);
        } else {
            ++it;
        }
    }
}

Exponent PrimeFactorization::exponent(const Integer& prime) const {
    auto it = factors_.find(prime);
    return it == factors_.end() ? 0 : it->second;
}

Integer PrimeFactorization::value() const {
    Integer result = 1;
    Integer power;
    for (const auto& [prime, exp] : factors_) {
        mpz_pow_ui(power.get_mpz_t(), prime.get_mpz_t(), exp);
        result *= power;
    }
    return result;
}

std::string PrimeFactorization::to_string() const {
    if (factors_.empty()) {
        return "1";
    }
    std::ostringstream oss;
    bool first = true;
    for (const auto& [prime, exp] : factors_) {
        if (!first) oss << " * ";
        first = false;
        oss << prime.get_str() << "^" << exp;
    }
    return oss.str();
}

PrimeFactorization factorize(const Integer& n) {
    if (sgn(n) < 0) {
        throw std::invalid_argument("Cannot factorize negative value " + n.get_str());
    }

    PrimeFactorization::map_type factors;
    if (n < 2) {
        return PrimeFactorization(std::move(factors));
    }

    Integer rest = n;
    // rest が縮んでも d * d <= rest の範囲で十分（残りの合成数は必ず √rest 以下の因数を持つ）
    for (Integer d = 2; d * d <= rest; ++d) {
        while (mpz_divisible_p(rest.get_mpz_t(), d.get_mpz_t())) {
            mpz_divexact(rest.get_mpz_t(), rest.get_mpz_t(), d.get_mpz_t());
            ++factors[d];
        }
    }
    if (rest > 1) {
        ++factors[rest];
    }

    return PrimeFactorization(std::move(factors));
}

std::ostream& operator<<(std::ostream& os, const PrimeFactorization& factorization) {
    return os << factorization.to_string();
}

} // namespace fractran
