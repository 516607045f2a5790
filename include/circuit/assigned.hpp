#pragma once

#include <ostream>

namespace plonkish {

/**
 * Assigned<F> - A field element that may be a deferred fraction
 *
 * Witness generators can divide without paying for an inversion per cell;
 * the backend evaluates the fraction when it stores the cell. A zero
 * denominator evaluates to zero.
 */
template<typename F>
class Assigned {
public:
    Assigned() : kind_(Kind::Zero), numerator_(F::zero()), denominator_(F::one()) {}

    // Implicit so that plain field elements can be assigned directly
    Assigned(const F& value) : kind_(Kind::Trivial), numerator_(value), denominator_(F::one()) {}

    static Assigned rational(const F& numerator, const F& denominator) {
        Assigned a;
        a.kind_ = Kind::Rational;
        a.numerator_ = numerator;
        a.denominator_ = denominator;
        return a;
    }

    const F& numerator() const { return numerator_; }
    const F& denominator() const { return denominator_; }

    bool is_rational() const { return kind_ == Kind::Rational; }

    bool is_zero_vartime() const {
        switch (kind_) {
            case Kind::Zero: return true;
            case Kind::Trivial: return numerator_ == F::zero();
            case Kind::Rational: return numerator_ == F::zero() || denominator_ == F::zero();
        }
        return false;
    }

    Assigned operator-() const {
        Assigned a = *this;
        if (kind_ != Kind::Zero) {
            a.numerator_ = -numerator_;
        }
        return a;
    }

    Assigned operator+(const Assigned& rhs) const {
        if (kind_ == Kind::Zero) return rhs;
        if (rhs.kind_ == Kind::Zero) return *this;
        if (kind_ == Kind::Trivial && rhs.kind_ == Kind::Trivial) {
            return Assigned(numerator_ + rhs.numerator_);
        }
        return rational(numerator_ * rhs.denominator_ + rhs.numerator_ * denominator_,
                        denominator_ * rhs.denominator_);
    }

    Assigned operator-(const Assigned& rhs) const {
        return *this + (-rhs);
    }

    Assigned operator*(const Assigned& rhs) const {
        if (kind_ == Kind::Zero || rhs.kind_ == Kind::Zero) return Assigned();
        if (kind_ == Kind::Trivial && rhs.kind_ == Kind::Trivial) {
            return Assigned(numerator_ * rhs.numerator_);
        }
        return rational(numerator_ * rhs.numerator_, denominator_ * rhs.denominator_);
    }

    Assigned& operator+=(const Assigned& rhs) { return *this = *this + rhs; }
    Assigned& operator-=(const Assigned& rhs) { return *this = *this - rhs; }
    Assigned& operator*=(const Assigned& rhs) { return *this = *this * rhs; }

    // Swaps numerator and denominator; the inverse of zero stays zero
    Assigned invert() const {
        switch (kind_) {
            case Kind::Zero: return Assigned();
            case Kind::Trivial: return rational(F::one(), numerator_);
            case Kind::Rational: return rational(denominator_, numerator_);
        }
        return Assigned();
    }

    // Requires F::inverse() only when the fraction is non-trivial
    F evaluate() const {
        switch (kind_) {
            case Kind::Zero: return F::zero();
            case Kind::Trivial: return numerator_;
            case Kind::Rational:
                if (denominator_ == F::one()) return numerator_;
                if (denominator_ == F::zero()) return F::zero();
                return numerator_ * denominator_.inverse();
        }
        return F::zero();
    }

    bool operator==(const Assigned& rhs) const {
        if (is_zero_vartime() || rhs.is_zero_vartime()) {
            return is_zero_vartime() && rhs.is_zero_vartime();
        }
        return numerator_ * rhs.denominator_ == rhs.numerator_ * denominator_;
    }
    bool operator!=(const Assigned& rhs) const { return !(*this == rhs); }

    friend std::ostream& operator<<(std::ostream& os, const Assigned& a) {
        if (a.kind_ == Kind::Rational) {
            return os << a.numerator_ << "/" << a.denominator_;
        }
        return os << a.numerator_;
    }

private:
    enum class Kind { Zero, Trivial, Rational };

    Kind kind_;
    F numerator_;
    F denominator_;
};

} // namespace plonkish
