#include <array>
#include <iostream>
#include <string>
#include <unordered_set>

#include <cstdint>
#include <tai64.hpp>

using namespace tai64;

// Helper function to print label details
void printLabel(const TaiValue& label, const std::string& name) {
    std::cout << name << ":\n";
    std::cout << "  Precision: " << precision_string(label.precision()) << " ("
              << label.size_bytes() << " bytes)\n";
    std::cout << "  Seconds: " << label.sec() << "\n";
    std::cout << "  Nanoseconds: " << label.nano() << "\n";
    std::cout << "  Attoseconds: " << label.atto() << "\n";
    std::cout << "  Canonical: " << label << "\n";
    std::cout << "  Hex: " << label.encode_hex() << "\n";
    std::cout << std::endl;
}

int main() {
    std::cout << "TAI64 Label Examples\n";
    std::cout << "====================\n\n";

    // Example 1: Creating labels
    std::cout << "1. Creating Labels\n";
    std::cout << "------------------\n";

    printLabel(Tai::epoch(), "Tai::epoch()");
    printLabel(TaiN(EPOCH, 999'999'999), "TaiN(EPOCH, 999999999)");
    printLabel(TaiA(EPOCH - 1, 0, 1), "TaiA(EPOCH - 1, 0, 1)");
    printLabel(TaiA::max(), "TaiA::max()");

    // Example 2: Validation
    std::cout << "2. Validation\n";
    std::cout << "-------------\n";

    try {
        TaiN bad(EPOCH, 1'000'000'000);
        std::cout << "unexpected: constructed " << bad << "\n";
    } catch (const RangeError& e) {
        std::cout << "TaiN(EPOCH, 1000000000) rejected: " << e.what() << "\n";
    }

    auto made = Tai::make(-1);
    if (!made) {
        std::cout << "Tai::make(-1) rejected: " << made.error().describe() << "\n";
    }

    // Decoding validates exactly like construction
    auto decoded = Tai::decode_hex("8000000000000000");
    if (!decoded) {
        std::cout << "Tai::decode_hex(\"8000000000000000\") rejected: "
                  << decoded.error().describe() << "\n\n";
    }

    // Example 3: Wire format
    std::cout << "3. Wire Format\n";
    std::cout << "--------------\n";

    TaiN label(EPOCH + 0x2a2b2c2d, 500'000'000);
    auto bytes = label.encode();
    std::cout << "Encoded " << label << " into " << bytes.size() << " bytes: "
              << label.encode_hex() << "\n";

    auto round_trip = TaiN::decode(bytes);
    std::cout << "Decoded back equal: " << (round_trip && *round_trip == label ? "yes" : "no")
              << "\n";

    // A label embedded at the front of a longer hex blob
    std::string blob = label.encode_hex() + "deadbeef";
    auto from_blob = TaiN::decode_hex(blob);
    std::cout << "Decoded from blob prefix: " << (from_blob ? to_string(*from_blob) : "error")
              << "\n";

    std::array<uint8_t, 4> short_buf{};
    auto written = label.encode_into(short_buf);
    if (!written) {
        std::cout << "encode_into(4 bytes) rejected: " << written.error().describe() << "\n\n";
    }

    // Example 4: Cross-precision comparisons
    std::cout << "4. Cross-Precision Comparisons\n";
    std::cout << "------------------------------\n";

    Tai t(EPOCH);
    TaiN tn(EPOCH, 0);
    TaiA ta(EPOCH, 0, 1);

    std::cout << "Tai(EPOCH) == TaiN(EPOCH, 0): " << (t == tn ? "true" : "false") << "\n";
    std::cout << "TaiN(EPOCH, 0) < TaiA(EPOCH, 0, 1): " << (tn < ta ? "true" : "false") << "\n";
    std::cout << "Tai(EPOCH) < TaiA(EPOCH, 0, 1): " << (t < ta ? "true" : "false") << "\n";

    // Equal values hash equal regardless of precision
    std::unordered_set<TaiValue> seen{t, tn, ta};
    std::cout << "Distinct instants among the three: " << seen.size() << "\n\n";

    // Example 5: Replacing fields
    std::cout << "5. Replacing Fields\n";
    std::cout << "-------------------\n";

    TaiA base(1234, 2345, 3456);
    std::cout << "base:                 " << base << "\n";
    std::cout << "replace({.nano = 6789}): " << base.replace({.nano = 6789}) << "\n";
    std::cout << "replace():             " << base.replace() << "\n";
    std::cout << "frac(): " << base.frac() << "\n";
    std::cout << "to_double(): " << base.to_double() << "\n";

    std::cout << "\nExample completed successfully!\n";

    return 0;
}
