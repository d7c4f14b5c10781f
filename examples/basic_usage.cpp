// Basic usage example for UUID7DER

#include <chrono>
#include <iomanip>
#include <iostream>

#include <boost/uuid/uuid_io.hpp>
#include <uuid7der.hpp>

namespace {

void print_hex(std::span<const uint8_t> bytes) {
    std::ios::fmtflags flags(std::cout.flags());
    for (uint8_t b : bytes) {
        std::cout << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    std::cout.flags(flags);
    std::cout << std::setfill(' ');
}

} // namespace

int main() {
    std::cout << "UUID7DER " << uuid7der::version_string << " - Basic Usage Example\n";
    std::cout << "====================================\n\n";

    // Example 1: Packing seeds into a UUIDv7
    {
        std::cout << "Example 1: Packing seeds\n";

        uuid7der::UuidV7Seeds seeds{0x0001'8E2C'1A2BULL, uuid7der::make_uint128(0, 0)};
        auto uuid = seeds.to_uuid();

        std::cout << "  UUID: " << uuid.to_boost_uuid() << "\n";
        uuid7der::describe(uuid7der::to_raw(uuid), std::cout);
        std::cout << "\n";
    }

    // Example 2: Validating a foreign value
    {
        std::cout << "Example 2: Validating a version 4 UUID\n";

        uuid7der::UnverifiedUuidV7 v4(
            uuid7der::make_uint128(0x0123'4567'89AB'4DEFULL, 0x8123'4567'89AB'CDEFULL));
        auto result = uuid7der::validate(v4);
        if (auto* invalid = std::get_if<uuid7der::InvalidUuid>(&result)) {
            std::cout << "  Validation failed: " << invalid->error_message() << "\n";
        }

        // The raw fields are still available
        uuid7der::describe(uuid7der::to_raw(v4), std::cout);
        std::cout << "\n";
    }

    // Example 3: DER projection of a freshly generated UUIDv7
    {
        std::cout << "Example 3: Generating and encoding\n";

        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
        auto asn1 = uuid7der::new_raw_uuid_v7_asn1(static_cast<uint64_t>(now_ms));
        if (auto* err = std::get_if<uuid7der::IoError>(&asn1)) {
            std::cerr << "  Generation failed: " << err->error_message() << "\n";
            return 1;
        }

        auto der = std::get<uuid7der::RawUuidV7Asn1>(asn1).to_der_bytes();
        if (auto* err = std::get_if<uuid7der::IoError>(&der)) {
            std::cerr << "  Encoding failed: " << err->error_message() << "\n";
            return 1;
        }

        const auto& bytes = std::get<std::vector<uint8_t>>(der);
        std::cout << "  DER (" << bytes.size() << " bytes): ";
        print_hex(bytes);
        std::cout << "\n\n";
    }

    std::cout << "All examples completed!\n";
    return 0;
}
