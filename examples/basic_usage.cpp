// Basic usage example for framehdr

#include <iostream>
#include <vector>

#include <framehdr.hpp>

int main() {
    std::cout << "framehdr - Basic Usage Example\n";
    std::cout << "==============================\n\n";

    std::vector<uint8_t> wire;

    // Example 1: Building and encoding a header
    {
        std::cout << "Example 1: Encoding an Opus frame header\n";

        auto result = framehdr::FrameHeader::create(framehdr::Encoding::opus, 960, 48000, 2, 16,
                                                    framehdr::Endianness::little, std::nullopt,
                                                    1000);
        if (auto* err = std::get_if<framehdr::HeaderError>(&result)) {
            std::cerr << "  Create failed: " << err->error_message() << "\n";
            return 1;
        }
        const auto& hdr = std::get<framehdr::FrameHeader>(result);

        framehdr::VectorSink sink(wire);
        if (auto err = framehdr::encode(hdr, sink)) {
            std::cerr << "  Encode failed: " << err->error_message() << "\n";
            return 1;
        }

        std::cout << "  Encoding: " << framehdr::encoding_string(hdr.encoding()) << "\n";
        std::cout << "  Header size: " << hdr.size() << " bytes\n";
        std::cout << "  Bytes:" << std::hex;
        for (uint8_t b : wire) {
            std::cout << " " << static_cast<int>(b);
        }
        std::cout << std::dec << "\n\n";
    }

    // Example 2: Rejected construction
    {
        std::cout << "Example 2: Invalid sample rate\n";

        auto result = framehdr::FrameHeader::create(framehdr::Encoding::pcm_signed, 1024, 22050,
                                                    2, 16, framehdr::Endianness::little,
                                                    std::nullopt, std::nullopt);
        if (auto err = framehdr::error_of(result)) {
            std::cout << "  Rejected: " << err->error_message() << "\n\n";
        }
    }

    // Example 3: Decoding (validates before returning a header)
    {
        std::cout << "Example 3: Decoding\n";

        auto result = framehdr::decode(std::span<const uint8_t>(wire));
        if (auto* err = std::get_if<framehdr::HeaderError>(&result)) {
            std::cerr << "  Decode failed: " << err->error_message() << "\n";
            return 1;
        }
        const auto& hdr = std::get<framehdr::FrameHeader>(result);

        std::cout << "  Sample rate: " << hdr.sample_rate() << " Hz\n";
        std::cout << "  Channels: " << static_cast<int>(hdr.channels()) << "\n";
        std::cout << "  Samples: " << hdr.sample_size() << "\n";
        if (hdr.pts()) {
            std::cout << "  PTS: " << *hdr.pts() << "\n";
        }
        std::cout << "\n";
    }

    // Example 4: Inspecting bytes without decoding
    {
        std::cout << "Example 4: Inspecting raw bytes\n";

        auto valid = framehdr::validate(wire);
        if (!framehdr::is_ok(valid) || !std::get<bool>(valid)) {
            std::cerr << "  Validation: FAILED\n";
            return 1;
        }
        std::cout << "  Validation: PASSED\n";

        auto count = framehdr::extract_sample_count(wire);
        if (framehdr::is_ok(count)) {
            std::cout << "  Sample count: " << std::get<uint16_t>(count) << "\n";
        }

        wire[0] = 0;
        auto broken = framehdr::extract_sample_count(wire);
        if (auto err = framehdr::error_of(broken)) {
            std::cout << "  After corrupting byte 0: " << err->error_message() << "\n\n";
        }
    }

    std::cout << "All examples completed!\n";
    return 0;
}
