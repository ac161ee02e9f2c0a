#pragma once

// FRAMEHDR - Compact media frame header codec
//
// A header-only C++20 library for the fixed-layout binary header that
// precedes an audio or video frame payload.
//
// Features:
// - Bit-exact encode/decode of the 32-bit header word plus optional
//   64-bit ID and PTS fields
// - Validating, immutable FrameHeader value type
// - Zero-copy inspection of encoded headers (validate / extract_*)
// - In-place field patching on raw buffers (patch_*) without re-encoding
// - Canonical (v2) and legacy (v1) wire layouts behind one interface
// - Pluggable ID transport codecs for hosts with limited integer precision

// ====================
// Public API
// ====================

// Core types, enums and error codes
#include "framehdr/core/types.hpp"

// Bit layout and wire revisions
#include "framehdr/core/layout.hpp"

// Error values and results
#include "framehdr/core/error.hpp"

// Header value object
#include "framehdr/core/frame_header.hpp"

// Byte sinks/sources and the stream codec
#include "framehdr/codec/byte_io.hpp"
#include "framehdr/codec/stream_codec.hpp"

// Buffer inspection and patching
#include "framehdr/core/header_view.hpp"

// ID transport codecs
#include "framehdr/codec/id_codec.hpp"
