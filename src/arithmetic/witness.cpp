#include "arithmetic/witness.hpp"
#include <fstream>
#include <stdexcept>
#include "types/b_field_element.hpp"

namespace plonkish {

namespace {

uint64_t require_u64(const nlohmann::json& json, const char* field) {
    if (!json.contains(field)) {
        throw std::runtime_error(std::string("witness JSON missing '") + field + "' field");
    }
    const auto& value = json[field];
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("witness field '") + field +
                                 "' must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

uint64_t require_field(const nlohmann::json& json, const char* field) {
    return require_field_value(std::string("witness field '") + field + "'",
                               require_u64(json, field));
}

} // namespace

uint64_t parse_u64(const std::string& what, const std::string& text) {
    size_t used = 0;
    uint64_t v = 0;
    try {
        if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
            v = std::stoull(text.substr(2), &used, 16);
            used += 2;
        } else {
            v = std::stoull(text, &used, 10);
        }
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for " + what + ": " + text);
    }
    // stoull accepts a leading '-' and wraps it
    if (used != text.size() || text.find('-') != std::string::npos) {
        throw std::runtime_error("invalid value for " + what + ": " + text);
    }
    return v;
}

uint64_t require_field_value(const std::string& what, uint64_t value) {
    if (value >= BFieldElement::MODULUS) {
        throw std::runtime_error(what + " = " + std::to_string(value) +
                                 " is not below the field modulus " +
                                 std::to_string(BFieldElement::MODULUS));
    }
    return value;
}

ArithmeticWitness ArithmeticWitness::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("witness JSON must be an object");
    }

    ArithmeticWitness witness;
    witness.x = require_field(json, "x");
    witness.y = require_field(json, "y");
    witness.constant = require_field(json, "constant");
    if (json.contains("public")) {
        witness.public_input = require_field(json, "public");
    }
    if (json.contains("k")) {
        uint64_t k = require_u64(json, "k");
        if (k == 0 || k > 24) {
            throw std::runtime_error("witness field 'k' must be in [1, 24]");
        }
        witness.k = static_cast<uint32_t>(k);
    }
    return witness;
}

ArithmeticWitness ArithmeticWitness::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open witness file: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Could not parse witness file " + path + ": " + e.what());
    }
    return from_json(json);
}

nlohmann::json ArithmeticWitness::to_json() const {
    nlohmann::json json;
    json["x"] = x;
    json["y"] = y;
    json["constant"] = constant;
    if (public_input) {
        json["public"] = *public_input;
    }
    json["k"] = k;
    return json;
}

} // namespace plonkish
