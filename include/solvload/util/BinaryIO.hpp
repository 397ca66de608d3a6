#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace solvload::util {

// Host-endian POD streaming used by the binary assignment file.
class BinaryWriter {
public:
  explicit BinaryWriter(std::ostream& os) : os_(os) {
    if (!os_) throw std::runtime_error("BinaryWriter: stream is not writable");
  }

  void write_bytes(const void* data, std::size_t n) {
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!os_) throw std::runtime_error("BinaryWriter: write failed");
  }

  template <typename T>
  void write_pod(const T& v) {
    static_assert(std::is_trivially_copyable_v<T>, "write_pod requires trivially copyable type");
    write_bytes(&v, sizeof(T));
  }

  template <typename T>
  void write_array(const T* v, std::size_t n) {
    static_assert(std::is_trivially_copyable_v<T>, "write_array requires trivially copyable type");
    if (n > 0) write_bytes(v, sizeof(T) * n);
  }

  void write_u32(std::uint32_t v) { write_pod(v); }
  void write_u64(std::uint64_t v) { write_pod(v); }

private:
  std::ostream& os_;
};

class BinaryReader {
public:
  explicit BinaryReader(std::istream& is) : is_(is) {
    if (!is_) throw std::runtime_error("BinaryReader: stream is not readable");
  }

  void read_bytes(void* data, std::size_t n) {
    is_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(n));
    if (!is_) throw std::runtime_error("BinaryReader: read failed (truncated/corrupt file?)");
  }

  template <typename T>
  void read_pod(T& v) {
    static_assert(std::is_trivially_copyable_v<T>, "read_pod requires trivially copyable type");
    read_bytes(&v, sizeof(T));
  }

  template <typename T>
  void read_array(T* v, std::size_t n) {
    static_assert(std::is_trivially_copyable_v<T>, "read_array requires trivially copyable type");
    if (n > 0) read_bytes(v, sizeof(T) * n);
  }

  std::uint32_t read_u32() { std::uint32_t v{}; read_pod(v); return v; }
  std::uint64_t read_u64() { std::uint64_t v{}; read_pod(v); return v; }

private:
  std::istream& is_;
};

inline void require_magic(std::istream& is, std::string_view magic, const std::string& what) {
  std::string got;
  got.resize(magic.size());
  is.read(got.data(), static_cast<std::streamsize>(magic.size()));
  if (!is) throw std::runtime_error(what + ": missing magic (truncated/corrupt file?)");
  if (std::string_view(got) != magic) {
    throw std::runtime_error(what + ": magic mismatch (expected '" + std::string(magic) + "')");
  }
}

inline void write_magic(std::ostream& os, std::string_view magic) {
  os.write(magic.data(), static_cast<std::streamsize>(magic.size()));
  if (!os) throw std::runtime_error("BinaryWriter: failed to write magic");
}

} // namespace solvload::util
