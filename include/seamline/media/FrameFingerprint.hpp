// Repository: Seamline
// Component: Frame Fingerprint
// Purpose: Header-only CRC32 fingerprint of a frame's Y plane. Used to tell
//          filler frames from content frames at segment seams.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_MEDIA_FRAME_FINGERPRINT_HPP_
#define SEAMLINE_MEDIA_FRAME_FINGERPRINT_HPP_

#include <algorithm>
#include <cstdint>
#include <string>

#include <zlib.h>

#include "seamline/buffer/Frame.hpp"

namespace seamline::media {

// Number of Y-plane bytes to fingerprint (first 4096).
static constexpr size_t kFingerprintYBytes = 4096;

// CRC32 of the first min(y_size, kFingerprintYBytes) bytes of Y plane data.
// Returns 0 if y_data is null or y_size is 0.
inline uint32_t CRC32YPlane(const uint8_t* y_data, size_t y_size) {
  if (!y_data || y_size == 0) return 0;
  size_t len = std::min(y_size, kFingerprintYBytes);
  return static_cast<uint32_t>(
      crc32(crc32(0L, Z_NULL, 0), y_data, static_cast<uInt>(len)));
}

inline uint32_t CRC32YPlane(const buffer::Frame& frame) {
  return CRC32YPlane(frame.data.data(), std::min(frame.YSize(), frame.data.size()));
}

// Seam record: the frame emitted on each side of a segment boundary.
struct SeamFingerprint {
  int64_t frame_index = 0;      // First output frame of the incoming segment
  size_t segment_index = 0;     // Incoming segment
  bool incoming_is_filler = false;
  uint32_t outgoing_crc32 = 0;  // 0 for the first segment
  uint32_t incoming_crc32 = 0;
};

}  // namespace seamline::media

#endif  // SEAMLINE_MEDIA_FRAME_FINGERPRINT_HPP_
