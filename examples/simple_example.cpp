/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic libpngchunk usage
 *
 * Builds a chunk, serializes it, parses it back, and shows how a
 * corrupted chunk is rejected. Warnings are printed to stderr.
 */

#include <pngchunk/chunk.hh>
#include <iostream>
#include <string_view>

int main() {
    using namespace pngchunk;

    std::cout << std::boolalpha;

    std::string_view message = "This is where your secret message will be!";
    std::vector<std::byte> payload(message.size());
    for (std::size_t i = 0; i < message.size(); i++) {
        payload[i] = static_cast<std::byte>(message[i]);
    }

    parse_options opts;
    opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view text) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << text << "\n";
    };

    try {
        chunk original(chunk_type("RuSt"), std::move(payload));
        std::cout << "Chunk: " << original.type()
                  << " (" << original.length() << " bytes, crc " << original.crc() << ")\n";
        std::cout << "  critical: " << original.type().is_critical()
                  << ", public: " << original.type().is_public()
                  << ", reserved bit valid: " << original.type().is_reserved_bit_valid()
                  << ", safe to copy: " << original.type().is_safe_to_copy() << "\n";

        auto bytes = original.to_bytes();
        auto parsed = chunk::parse(bytes, opts);
        std::cout << "Parsed back: \"" << parsed.to_string() << "\"\n";

        // Corrupt the last byte of the crc field
        bytes.back() ^= std::byte{1};
        try {
            (void)chunk::parse(bytes, opts);
        } catch (const invalid_crc& e) {
            std::cout << "Corruption detected: " << e.what() << "\n";
        }

    } catch (const pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
