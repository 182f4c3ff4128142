/**
 * @file cli.cpp
 * @brief tailbits command line interface.
 *
 * Evaluates a single bit set operation on operands written as binary
 * ("1010", "0b1010") or hexadecimal ("0xff") text and prints the result.
 */

#include <tailbits/tailbits.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

using namespace tailbits;

static constexpr long long MAX_SHIFT_COUNT = 1LL << 24;

static void print_version() {
    std::printf("tailbits %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\ntailbits %s - unbounded bit set calculator\n", version());
    std::printf("=========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <op> <a>            unary operation\n", prog_name);
    std::printf("  %s <op> <a> <b>        binary operation\n", prog_name);
    std::printf("  %s <shift> <a> <n>     shift by n bits\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Unary operations:\n");
    std::printf("  not            Complement (result may be indefinite)\n");
    std::printf("  card           Number of set bits\n");
    std::printf("  msb, lsb       Highest / lowest set bit\n");
    std::printf("  array          Indices of set bits\n");
    std::printf("  bin, hex       Render in base 2 / 16\n\n");
    std::printf("Binary operations:\n");
    std::printf("  and, or, xor, andnot, equals\n\n");
    std::printf("Shifts:\n");
    std::printf("  lshift, rshift\n\n");
    std::printf("Operands:\n");
    std::printf("  1010, 0b1010   Binary, most significant bit first\n");
    std::printf("  0xaffe         Hexadecimal\n\n");
    std::printf("Examples:\n");
    std::printf("  %s and 0b1100 0b1010       # 1000\n", prog_name);
    std::printf("  %s not 0x0f                # ...11110000\n", prog_name);
    std::printf("  %s lshift 0b1 4            # 10000\n\n", prog_name);
}

static void print_index(std::size_t index) {
    if (index == BitSet::npos) {
        std::printf("none\n");
    } else {
        std::printf("%zu\n", index);
    }
}

static int do_unary(const std::string& op, const BitSet& a) {
    if (op == "not") {
        std::printf("%s\n", a.not_().to_string().c_str());
    } else if (op == "card") {
        std::printf("%zu\n", a.cardinality());
    } else if (op == "msb") {
        print_index(a.msb());
    } else if (op == "lsb") {
        print_index(a.lsb());
    } else if (op == "array") {
        std::vector<std::size_t> indices = a.to_array();
        std::printf("[");
        for (std::size_t i = 0; i < indices.size(); ++i) {
            if (i > 0) {
                std::printf(", ");
            }
            std::printf("%zu", indices[i]);
        }
        std::printf("]\n");
    } else if (op == "bin") {
        std::printf("%s\n", a.to_string(2).c_str());
    } else if (op == "hex") {
        std::printf("%s\n", a.to_string(16).c_str());
    } else {
        std::fprintf(stderr, "Error: Unknown unary operation: %s\n", op.c_str());
        return 1;
    }
    return 0;
}

static int do_binary(const std::string& op, const BitSet& a, const char* arg) {
    if (op == "lshift" || op == "rshift") {
        char* end = nullptr;
        long long count = std::strtoll(arg, &end, 10);
        if (end == arg || *end != '\0' || count < 0) {
            std::fprintf(stderr, "Error: Shift count must be a non-negative integer: %s\n", arg);
            return 1;
        }
        if (count > MAX_SHIFT_COUNT) {
            std::fprintf(stderr, "Error: Shift count exceeds %lld: %s\n", MAX_SHIFT_COUNT, arg);
            return 1;
        }
        BitSet result = a.clone();
        if (op == "lshift") {
            result.lshift(count);
        } else {
            result.rshift(count);
        }
        std::printf("%s\n", result.to_string().c_str());
        return 0;
    }

    BitSet b(arg);
    if (op == "and") {
        std::printf("%s\n", a.and_(b).to_string().c_str());
    } else if (op == "or") {
        std::printf("%s\n", a.or_(b).to_string().c_str());
    } else if (op == "xor") {
        std::printf("%s\n", a.xor_(b).to_string().c_str());
    } else if (op == "andnot") {
        std::printf("%s\n", a.and_not(b).to_string().c_str());
    } else if (op == "equals") {
        std::printf("%s\n", a.equals(b) ? "true" : "false");
    } else {
        std::fprintf(stderr, "Error: Unknown binary operation: %s\n", op.c_str());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (argc != 3 && argc != 4) {
        std::fprintf(stderr, "Error: Expected an operation and one or two operands\n");
        std::fprintf(stderr, "Usage: %s <op> <a> [b|n]\n", argv[0]);
        return 1;
    }

    const std::string op = argv[1];

    try {
        BitSet a(argv[2]);
        return (argc == 3) ? do_unary(op, a) : do_binary(op, a, argv[3]);
    } catch (const BitSetException& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
