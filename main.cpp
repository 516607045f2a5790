#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "arithmetic/arithmetic_circuit.hpp"
#include "arithmetic/witness.hpp"
#include "dev/mock_prover.hpp"
#include "plonk/keygen.hpp"
#include "types/b_field_element.hpp"

using namespace plonkish;

static void print_usage(const char* argv0) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << argv0 << " [--witness <file.json>] [--x N] [--y N] [--constant N]"
              << " [--public N] [--k K] [--shape-out <file.json>]\n";
    std::cerr << "    Checks x^2 * y^2 + constant == public with the mock backend.\n";
    std::cerr << "    Command-line values override the witness file; a missing --public\n";
    std::cerr << "    defaults to the honest output.\n";
}

int main(int argc, char* argv[]) {
    ArithmeticWitness witness;
    std::string shape_out;

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        // Load the witness file first so that flags override it
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--witness" && i + 1 < args.size()) {
                witness = ArithmeticWitness::load(args[i + 1]);
            }
        }
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--help" || flag == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (i + 1 >= args.size()) {
                throw std::runtime_error("missing value for " + flag);
            }
            const std::string& value = args[++i];
            if (flag == "--witness") {
                continue;
            } else if (flag == "--x") {
                witness.x = require_field_value(flag, parse_u64(flag, value));
            } else if (flag == "--y") {
                witness.y = require_field_value(flag, parse_u64(flag, value));
            } else if (flag == "--constant") {
                witness.constant = require_field_value(flag, parse_u64(flag, value));
            } else if (flag == "--public") {
                witness.public_input = require_field_value(flag, parse_u64(flag, value));
            } else if (flag == "--k") {
                uint64_t k = parse_u64(flag, value);
                if (k == 0 || k > 24) {
                    throw std::runtime_error("--k must be in [1, 24]");
                }
                witness.k = static_cast<uint32_t>(k);
            } else if (flag == "--shape-out") {
                shape_out = value;
            } else {
                throw std::runtime_error("unknown option " + flag);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

#ifdef _OPENMP
    PLONKISH_PROFILE_PRINT("[main] OpenMP max threads: %d\n", omp_get_max_threads());
#endif

    try {
        const BFE x(witness.x);
        const BFE y(witness.y);
        const BFE constant(witness.constant);
        const BFE expected = ArithmeticCircuit<BFE>::public_output(x, y, constant);
        const BFE public_input = witness.public_input ? BFE(*witness.public_input) : expected;

        std::cout << "Circuit: x^2 * y^2 + constant = PI[0] on 2^" << witness.k << " rows" << std::endl;
        std::cout << "  constant = " << constant << ", PI[0] = " << public_input
                  << " (honest output " << expected << ")" << std::endl;

        ArithmeticCircuit<BFE> circuit(Value<BFE>::known(x), Value<BFE>::known(y), constant);

        // Keys are derived from the shape alone
        CircuitShape shape = keygen::derive_shape<BFE>(witness.k, circuit.without_witnesses());
        std::cout << "Shape: " << shape.regions.size() << " regions, "
                  << shape.fixed.size() << " non-zero selector cells" << std::endl;

        if (!shape_out.empty()) {
            std::ofstream out(shape_out);
            if (!out.is_open()) {
                throw std::runtime_error("Could not open shape output: " + shape_out);
            }
            out << shape.to_json().dump(2) << std::endl;
            std::cout << "  Shape written to " << shape_out << std::endl;
        }

        auto prover = MockProver<BFE>::run(witness.k, circuit, {{public_input}});
        auto failures = prover.verify();
        if (failures.empty()) {
            std::cout << "Verification: OK" << std::endl;
            return 0;
        }

        std::cout << "Verification: FAILED (" << failures.size() << " failures)" << std::endl;
        for (const auto& failure : failures) {
            std::cout << "  " << failure << std::endl;
        }
        return 1;
    } catch (const Error& e) {
        std::cerr << "Synthesis error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
