// tai64-decode: print the canonical form of hex-encoded TAI64 labels
//
// Usage:
//   tai64-decode [-p s|n|a] HEX...
//
// Without -p the precision is inferred from the length of each argument
// (16, 24 or 32 hex digits). With -p every argument is decoded at that
// precision and any text after the label is ignored.

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <tai64.hpp>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-p s|n|a] HEX...\n"
              << "  -p s   TAI64   (16 hex digits)\n"
              << "  -p n   TAI64N  (24 hex digits)\n"
              << "  -p a   TAI64NA (32 hex digits)\n";
}

std::optional<tai64::Precision> parse_precision(std::string_view arg) {
    if (arg == "s")
        return tai64::Precision::seconds;
    if (arg == "n")
        return tai64::Precision::nanoseconds;
    if (arg == "a")
        return tai64::Precision::attoseconds;
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<tai64::Precision> forced;
    int first = 1;

    if (argc > 2 && std::string_view(argv[1]) == "-p") {
        forced = parse_precision(argv[2]);
        if (!forced) {
            std::cerr << "error: unknown precision '" << argv[2] << "'\n";
            print_usage(argv[0]);
            return 2;
        }
        first = 3;
    }

    if (first >= argc) {
        print_usage(argv[0]);
        return 2;
    }

    int status = 0;
    for (int i = first; i < argc; ++i) {
        std::string_view text(argv[i]);

        auto precision = forced ? forced : tai64::detect_precision(text.size());
        if (!precision) {
            std::cerr << "error: " << text << ": length " << text.size()
                      << " is not 16, 24 or 32 hex digits\n";
            status = 1;
            continue;
        }

        auto label = tai64::TaiValue::decode_hex(*precision, text);
        if (!label) {
            std::cerr << "error: " << text << ": " << label.error().describe() << "\n";
            status = 1;
            continue;
        }

        std::cout << tai64::precision_string(label->precision()) << " " << *label << "\n";
    }

    return status;
}
