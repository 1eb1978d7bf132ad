#ifndef BITPACK_CORE_PRIMITIVE_HPP
#define BITPACK_CORE_PRIMITIVE_HPP

// Codecs for bool and the fixed-width integers.
//
// An N-bit integer at bit offset o covers ceil((o % 8 + N) / 8) bytes
// starting at byte o / 8. Byte-aligned offsets are a plain big-endian
// copy of N / 8 bytes. Otherwise the value is shifted right by o % 8
// across N / 8 bytes, and its low o % 8 bits spill into the top of one
// trailing byte.

#include <cstddef>
#include <cstdint>

#include "bitpack/core/bits.hpp"
#include "bitpack/core/checks.hpp"
#include "bitpack/core/codec.hpp"

namespace bitpack {

namespace detail {

template <UnsignedInteger U>
U unpackUnsigned(ByteView Bytes, std::size_t Offset) {
  constexpr std::size_t NumBytes = sizeof(U);
  const std::uint8_t *Src = Bytes.data() + Offset / 8;
  const unsigned Shift = Offset % 8;

  if (Shift == 0) {
    U Out = 0;
    for (std::size_t I = 0; I < NumBytes; ++I)
      Out = static_cast<U>((Out << 8) | U(Src[I]));
    return Out;
  }

  // The first byte's top Shift bits belong to the previous field and are
  // shifted out of U.
  U Out = static_cast<U>(U(Src[0]) << Shift);
  for (std::size_t I = 1; I < NumBytes; ++I)
    Out = static_cast<U>((Out << 8) | (U(Src[I]) << Shift));
  Out = static_cast<U>(Out | U(Src[NumBytes] >> (8 - Shift)));
  return Out;
}

template <UnsignedInteger U>
void packUnsigned(U Val, ByteSpan Bytes, std::size_t Offset) {
  constexpr std::size_t NumBytes = sizeof(U);
  std::uint8_t *Dst = Bytes.data() + Offset / 8;
  const unsigned Shift = Offset % 8;

  if (Shift == 0) {
    for (std::size_t I = 0; I < NumBytes; ++I)
      Dst[I] = static_cast<std::uint8_t>(Val >> (8 * (NumBytes - 1 - I)));
    return;
  }

  const U Head = static_cast<U>(Val >> Shift);
  const auto Keep = static_cast<std::uint8_t>(0xFF << (8 - Shift));
  Dst[0] = static_cast<std::uint8_t>(
      (Dst[0] & Keep) | static_cast<std::uint8_t>(Head >> (8 * (NumBytes - 1))));
  for (std::size_t I = 1; I < NumBytes; ++I)
    Dst[I] = static_cast<std::uint8_t>(Head >> (8 * (NumBytes - 1 - I)));

  // Low Shift bits of the value go to the top of the trailing byte.
  const auto Tail =
      static_cast<std::uint8_t>(static_cast<std::uint8_t>(Val) << (8 - Shift));
  Dst[NumBytes] = static_cast<std::uint8_t>((Dst[NumBytes] & ~Keep) | Tail);
}

} // namespace detail

template <>
struct Codec<bool> {
  static constexpr std::size_t width = 1;

  static bool unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    return (Bytes[Offset / 8] >> (7 - Offset % 8)) & 1;
  }

  static void pack(bool Val, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
    const unsigned Pos = 7 - Offset % 8;
    std::uint8_t &Byte = Bytes[Offset / 8];
    Byte = static_cast<std::uint8_t>((Byte & ~(1u << Pos)) |
                                     (unsigned(Val) << Pos));
  }
};

template <UnsignedInteger T>
struct Codec<T> {
  static constexpr std::size_t width = sizeof(T) * 8;

  static T unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    return detail::unpackUnsigned<T>(Bytes, Offset);
  }

  static void pack(T Val, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
    detail::packUnsigned<T>(Val, Bytes, Offset);
  }
};

// Same bits as the unsigned integer of equal width.
template <SignedInteger T>
struct Codec<T> {
  using unsigned_type = bits_t<int(sizeof(T) * 8)>;

  static constexpr std::size_t width = Codec<unsigned_type>::width;

  static T unpack(ByteView Bytes, std::size_t Offset) {
    return static_cast<T>(Codec<unsigned_type>::unpack(Bytes, Offset));
  }

  static void pack(T Val, ByteSpan Bytes, std::size_t Offset) {
    Codec<unsigned_type>::pack(static_cast<unsigned_type>(Val), Bytes,
                               Offset);
  }
};

} // namespace bitpack

#endif // BITPACK_CORE_PRIMITIVE_HPP
