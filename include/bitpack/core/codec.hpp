#ifndef BITPACK_CORE_CODEC_HPP
#define BITPACK_CORE_CODEC_HPP

// The codec contract.
//
// Codec<T> describes how a T lives in a bit buffer:
//
//   static constexpr std::size_t width;            // bits, no padding
//   static T    unpack(ByteView, std::size_t offset);
//   static void pack(T value, ByteSpan, std::size_t offset);
//
// Offsets are absolute bit positions, bit 0 being the most significant
// bit of byte 0. Values are laid out most-significant-bit first and may
// start and end anywhere inside a byte. pack only changes the bits in
// [offset, offset + width); neighbouring bits in shared bytes survive.
//
// The primary template is empty: a type is packable exactly when a
// specialization provides the three members (see Packed).

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace bitpack {

using ByteSpan = std::span<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

template <typename T>
struct Codec {};

template <typename T>
concept Packed = requires(T Val, ByteView In, ByteSpan Out,
                          std::size_t Offset) {
  { Codec<T>::width } -> std::convertible_to<std::size_t>;
  { Codec<T>::unpack(In, Offset) } -> std::same_as<T>;
  { Codec<T>::pack(std::move(Val), Out, Offset) } -> std::same_as<void>;
};

template <Packed T>
inline constexpr std::size_t width_v = Codec<T>::width;

// Width from an instance, for call sites that do not name the type.
template <Packed T>
constexpr std::size_t width_of(const T &) noexcept {
  return width_v<T>;
}

// Smallest buffer holding one T whose first bit is at Offset.
template <Packed T>
constexpr std::size_t bytes_needed(std::size_t Offset = 0) noexcept {
  return (Offset + width_v<T> + 7) / 8;
}

template <Packed T>
T unpack(ByteView Bytes, std::size_t Offset) {
  return Codec<T>::unpack(Bytes, Offset);
}

template <Packed T>
void pack(T Val, ByteSpan Bytes, std::size_t Offset) {
  Codec<T>::pack(std::move(Val), Bytes, Offset);
}

} // namespace bitpack

#endif // BITPACK_CORE_CODEC_HPP
