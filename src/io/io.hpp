// src/io/io.hpp
// Thin I/O façade for whole-file reads and writes.
//
//   auto bytes = io::read_all(path);
//   io::write_all_atomic(path, bytes);
//
// write_all_atomic writes a sibling "<name>.tmp" first and renames it over the
// target, so a reader (or a backup job) never sees a half-written file.
//
// Throws std::runtime_error on errors.

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace io {

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + path.string());
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + path.string());
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw std::runtime_error("Could not read file: " + path.string());
  }
  return buf;
}

inline void write_all_atomic(const std::filesystem::path &path,
                             const std::vector<std::uint8_t> &bytes) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      throw std::runtime_error("Could not create file: " + tmp.string());
    }
    f.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      throw std::runtime_error("Could not write file: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw std::runtime_error("Could not move " + tmp.string() + " into place: " +
                             ec.message());
  }
}

} // namespace io
