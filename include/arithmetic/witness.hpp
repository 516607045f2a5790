#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace plonkish {

/**
 * ArithmeticWitness - Inputs of one x^2 * y^2 + constant run
 *
 * JSON form:
 *   {"x": 2, "y": 3, "constant": 5, "public": 41, "k": 4}
 * "public" and "k" are optional; a missing public input means the honest one.
 * x, y, constant and public are field elements and must be below the modulus.
 */
struct ArithmeticWitness {
    static constexpr uint32_t DEFAULT_K = 4;

    uint64_t x = 0;
    uint64_t y = 0;
    uint64_t constant = 0;
    std::optional<uint64_t> public_input;
    uint32_t k = DEFAULT_K;

    static ArithmeticWitness from_json(const nlohmann::json& json);
    static ArithmeticWitness load(const std::string& path);

    nlohmann::json to_json() const;
};

// Decimal or 0x-prefixed hex; the whole string must be consumed
uint64_t parse_u64(const std::string& what, const std::string& text);

// Returns value, or throws std::runtime_error if it is not a canonical field element
uint64_t require_field_value(const std::string& what, uint64_t value);

} // namespace plonkish
