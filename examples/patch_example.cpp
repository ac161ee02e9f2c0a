// In-place header rewriting with framehdr
//
// Demonstrates:
// - Patching fixed fields in a received buffer
// - Adding an ID in front of an existing PTS
// - Working with the legacy layout

#include <array>
#include <iostream>

#include <framehdr.hpp>

namespace {

void print_header(const char* label, std::span<const uint8_t> bytes,
                  const framehdr::WireLayout& layout = framehdr::layout_v2) {
    auto result = framehdr::decode(bytes, layout);
    if (auto* err = std::get_if<framehdr::HeaderError>(&result)) {
        std::cerr << "  " << label << ": " << err->error_message() << "\n";
        return;
    }
    const auto& hdr = std::get<framehdr::FrameHeader>(result);

    std::cout << "  " << label << ": " << framehdr::encoding_string(hdr.encoding()) << ", "
              << hdr.sample_size() << " samples @ " << hdr.sample_rate() << " Hz, "
              << static_cast<int>(hdr.channels()) << " ch";
    if (hdr.id()) {
        std::cout << ", id=" << *hdr.id();
    }
    if (hdr.pts()) {
        std::cout << ", pts=" << *hdr.pts();
    }
    std::cout << " (" << hdr.size() << " bytes)\n";
}

} // namespace

int main() {
    std::cout << "framehdr - Patch Example\n";
    std::cout << "========================\n\n";

    // Room for the largest header, so any optional field can be added
    std::array<uint8_t, framehdr::max_header_size> buffer{};

    auto created = framehdr::FrameHeader::create(framehdr::Encoding::flac, 1152, 44100, 2, 16,
                                                 framehdr::Endianness::little, std::nullopt,
                                                 5000);
    if (auto err = framehdr::error_of(created)) {
        std::cerr << "Create failed: " << err->error_message() << "\n";
        return 1;
    }

    framehdr::SpanSink sink(buffer);
    if (auto err = framehdr::encode(std::get<framehdr::FrameHeader>(created), sink)) {
        std::cerr << "Encode failed: " << err->error_message() << "\n";
        return 1;
    }

    std::cout << "Patching fixed fields\n";
    print_header("before", buffer);

    framehdr::HeaderView view(buffer);
    if (auto err = view.patch_sample_size(576)) {
        std::cerr << "  patch_sample_size: " << err->error_message() << "\n";
        return 1;
    }
    if (auto err = view.patch_channels(1)) {
        std::cerr << "  patch_channels: " << err->error_message() << "\n";
        return 1;
    }
    print_header("after", buffer);

    // Invalid values are refused and the buffer stays as it was
    if (auto err = view.patch_sample_rate(22050)) {
        std::cout << "  refused: " << err->error_message() << "\n";
    }
    std::cout << "\n";

    std::cout << "Adding an ID (PTS moves behind it)\n";
    if (auto err = view.patch_id(0xC0FFEE)) {
        std::cerr << "  patch_id: " << err->error_message() << "\n";
        return 1;
    }
    print_header("tagged", buffer);

    if (auto err = view.patch_id(std::nullopt)) {
        std::cerr << "  patch_id: " << err->error_message() << "\n";
        return 1;
    }
    print_header("untagged", buffer);
    std::cout << "\n";

    std::cout << "Legacy layout\n";
    std::array<uint8_t, framehdr::max_header_size> legacy{};
    framehdr::SpanSink legacy_sink(legacy);
    auto legacy_hdr = framehdr::FrameHeader::create(framehdr::Encoding::pcm_signed, 256, 16000, 1,
                                                    16, framehdr::Endianness::big, 7,
                                                    std::nullopt);
    if (auto err = framehdr::error_of(legacy_hdr)) {
        std::cerr << "  Create failed: " << err->error_message() << "\n";
        return 1;
    }
    if (auto err = framehdr::encode(std::get<framehdr::FrameHeader>(legacy_hdr), legacy_sink,
                                    framehdr::layout_v1)) {
        std::cerr << "  Encode failed: " << err->error_message() << "\n";
        return 1;
    }
    print_header("v1", legacy, framehdr::layout_v1);

    if (auto err = framehdr::patch_pts(legacy, 1, framehdr::layout_v1)) {
        std::cout << "  refused: " << err->error_message() << "\n";
    }
    print_header("as v2", legacy);

    std::cout << "\nDone.\n";
    return 0;
}
