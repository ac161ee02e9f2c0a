#pragma once

#include <concepts>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace framehdr {

// Outcome of an exact-length read
enum class ReadStatus : uint8_t {
    ok,           ///< All requested bytes were read
    end_of_input, ///< Source ran out before the request was satisfied
    error         ///< Source failed for another reason
};

/**
 * @brief Concept for sequential byte sinks
 *
 * write() appends all bytes or reports failure.
 *
 * @tparam T The type to check
 */
template <typename T>
concept ByteSink = requires(T& sink, std::span<const uint8_t> bytes) {
    { sink.write(bytes) } -> std::same_as<bool>;
};

/**
 * @brief Concept for sequential byte sources with exact-length reads
 *
 * read_exact() fills the whole span or reports why it couldn't; end of input
 * is reported separately from other failures.
 *
 * @tparam T The type to check
 */
template <typename T>
concept ByteSource = requires(T& source, std::span<uint8_t> bytes) {
    { source.read_exact(bytes) } -> std::same_as<ReadStatus>;
};

/**
 * Sink appending to a caller-owned vector
 */
class VectorSink {
public:
    explicit VectorSink(std::vector<uint8_t>& out) noexcept : out_(&out) {}

    bool write(std::span<const uint8_t> bytes) {
        out_->insert(out_->end(), bytes.begin(), bytes.end());
        return true;
    }

private:
    std::vector<uint8_t>* out_;
};

/**
 * Sink over a fixed-capacity buffer
 *
 * A write that doesn't fit is rejected whole; nothing is written.
 */
class SpanSink {
public:
    explicit SpanSink(std::span<uint8_t> buffer) noexcept : buffer_(buffer) {}

    bool write(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() > buffer_.size() - written_) {
            return false;
        }
        if (!bytes.empty()) {
            std::memcpy(buffer_.data() + written_, bytes.data(), bytes.size());
        }
        written_ += bytes.size();
        return true;
    }

    size_t bytes_written() const noexcept { return written_; }

    std::span<const uint8_t> written() const noexcept { return buffer_.first(written_); }

private:
    std::span<uint8_t> buffer_;
    size_t written_{0};
};

/**
 * Source reading sequentially from a caller-owned span
 *
 * A short read consumes nothing.
 */
class SpanSource {
public:
    explicit SpanSource(std::span<const uint8_t> buffer) noexcept : buffer_(buffer) {}

    ReadStatus read_exact(std::span<uint8_t> bytes) noexcept {
        if (bytes.size() > remaining()) {
            return ReadStatus::end_of_input;
        }
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), buffer_.data() + position_, bytes.size());
        }
        position_ += bytes.size();
        return ReadStatus::ok;
    }

    size_t position() const noexcept { return position_; }
    size_t remaining() const noexcept { return buffer_.size() - position_; }

private:
    std::span<const uint8_t> buffer_;
    size_t position_{0};
};

/**
 * Sink writing to a std::ostream (file, string stream, ...)
 */
class OstreamSink {
public:
    explicit OstreamSink(std::ostream& os) noexcept : os_(&os) {}

    bool write(std::span<const uint8_t> bytes) {
        os_->write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(*os_);
    }

private:
    std::ostream* os_;
};

/**
 * Source reading from a std::istream
 *
 * End of file before the request is satisfied maps to end_of_input; any other
 * stream failure maps to error.
 */
class IstreamSource {
public:
    explicit IstreamSource(std::istream& is) noexcept : is_(&is) {}

    ReadStatus read_exact(std::span<uint8_t> bytes) {
        if (bytes.empty()) {
            return ReadStatus::ok;
        }
        is_->read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (static_cast<size_t>(is_->gcount()) == bytes.size()) {
            return ReadStatus::ok;
        }
        return is_->eof() ? ReadStatus::end_of_input : ReadStatus::error;
    }

private:
    std::istream* is_;
};

static_assert(ByteSink<VectorSink>);
static_assert(ByteSink<SpanSink>);
static_assert(ByteSink<OstreamSink>);
static_assert(ByteSource<SpanSource>);
static_assert(ByteSource<IstreamSource>);

} // namespace framehdr
