#ifndef SHAREDIDX_BYTE_ORDER_HPP
#define SHAREDIDX_BYTE_ORDER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Little-endian integer encoding used by the on-disk formats.
namespace sharedidx::le {

template <typename T> inline void put(std::vector<std::byte> &out, T value) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<std::byte>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff));
  }
}

template <typename T> inline T get(const std::byte *in) {
  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<uint64_t>(std::to_integer<uint8_t>(in[i])) << (8 * i);
  }
  return static_cast<T>(value);
}

} // namespace sharedidx::le

#endif // SHAREDIDX_BYTE_ORDER_HPP
