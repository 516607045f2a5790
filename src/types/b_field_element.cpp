#include "types/b_field_element.hpp"
#include <stdexcept>

namespace plonkish {

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Both operands are below p, so one conditional subtraction suffices.
    // The raw sum may wrap past 2^64, which also calls for it.
    uint64_t sum = value_ + rhs.value_;
    if (sum < value_ || sum >= MODULUS) {
        sum -= MODULUS;
    }
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    if (value_ < rhs.value_) {
        diff += MODULUS;
    }
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * rhs.value_;
    return BFieldElement(static_cast<uint64_t>(product % MODULUS));
}

BFieldElement BFieldElement::operator-() const {
    return value_ == 0 ? *this : BFieldElement(MODULUS - value_);
}

BFieldElement BFieldElement::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }

    // a^(p-2) by square-and-multiply
    BFieldElement result = one();
    BFieldElement base = *this;
    for (uint64_t exp = MODULUS - 2; exp > 0; exp >>= 1) {
        if (exp & 1) {
            result = result * base;
        }
        base = base * base;
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace plonkish
