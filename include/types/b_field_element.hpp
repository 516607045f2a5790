#pragma once

#include <cstdint>
#include <ostream>

namespace plonkish {

using uint128_t = __uint128_t;

/**
 * BFieldElement - Goldilocks field element, p = 2^64 - 2^32 + 1
 *
 * The concrete F the circuits are instantiated with. Values are canonical,
 * so == compares representatives directly. inverse() is only reached when a
 * rational Assigned cell is evaluated.
 */
class BFieldElement {
public:
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}

    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }

    constexpr uint64_t value() const { return value_; }
    bool is_zero() const { return value_ == 0; }

    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator-() const;

    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }

    // Throws std::domain_error on zero
    BFieldElement inverse() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;
};

using BFE = BFieldElement;

} // namespace plonkish
