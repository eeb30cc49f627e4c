// src/common/writer.hpp
// The write-side twin of Bytes: appends big-endian integers and MIDI VLQs to
// a growable buffer. Used by the SMF encoder.
#pragma once
#include <cstdint>
#include <stdexcept>
#include <vector>

struct ByteWriter {
  std::vector<std::uint8_t> data;

  void u8(std::uint8_t v) { data.push_back(v); }

  void be16(std::uint16_t v) {
    data.push_back(static_cast<std::uint8_t>(v >> 8));
    data.push_back(static_cast<std::uint8_t>(v & 0xFF));
  }

  void be24(std::uint32_t v) {
    if (v > 0xFFFFFF)
      throw std::runtime_error("value does not fit in 24 bits");
    data.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    data.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    data.push_back(static_cast<std::uint8_t>(v & 0xFF));
  }

  void be32(std::uint32_t v) {
    data.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    data.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    data.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    data.push_back(static_cast<std::uint8_t>(v & 0xFF));
  }

  void bytes(const std::vector<std::uint8_t> &src) {
    data.insert(data.end(), src.begin(), src.end());
  }

  // Overwrite a be32 written earlier (chunk lengths are patched after the
  // chunk body is known).
  void patch_be32(std::size_t at, std::uint32_t v) {
    if (at + 4 > data.size())
      throw std::runtime_error("patch_be32 out of range");
    data[at] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
    data[at + 1] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    data[at + 2] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    data[at + 3] = static_cast<std::uint8_t>(v & 0xFF);
  }

  [[nodiscard]] std::size_t size() const { return data.size(); }
};

// Write a MIDI VLQ: 7 bits per byte, most significant group first, high bit
// set on every byte except the last.
inline void write_vlq(ByteWriter &w, std::uint32_t v) {
  if (v > 0x0FFFFFFF)
    throw std::runtime_error("VLQ value exceeds 28 bits");
  std::uint8_t groups[4];
  int n = 0;
  do {
    groups[n++] = static_cast<std::uint8_t>(v & 0x7F);
    v >>= 7;
  } while (v != 0);
  while (n > 1) {
    w.u8(static_cast<std::uint8_t>(groups[--n] | 0x80));
  }
  w.u8(groups[0]);
}
