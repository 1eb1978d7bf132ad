// Smoke test: verify the published layout vector.
//
// u16 42 at bit offset 3 in a zeroed 3-byte buffer:
//   00000000 00000101 01000000
// and unpacking it at offset 3 must give 42 back.

#include <array>
#include <cstdint>
#include <cstdio>

#include "bitpack/bitpack.hpp"

int main() {
  const std::array<std::uint8_t, 3> Expected = {0b00000000, 0b00000101,
                                                0b01000000};
  std::array<std::uint8_t, 3> Buf = {};

  bitpack::pack(std::uint16_t{42}, Buf, 3);

  if (Buf != Expected) {
    std::fprintf(stderr,
                 "FAIL: pack(u16 42, offset 3) = %02X %02X %02X, expected "
                 "00 05 40\n",
                 Buf[0], Buf[1], Buf[2]);
    return 1;
  }

  const auto Back = bitpack::unpack<std::uint16_t>(Buf, 3);
  if (Back != 42) {
    std::fprintf(stderr, "FAIL: unpack(offset 3) = %u, expected 42\n",
                 static_cast<unsigned>(Back));
    return 1;
  }

  std::printf("PASS: u16 42 at bit offset 3 = 00 05 40\n");
  return 0;
}
