#ifndef BITPACK_CORE_COMPOSITE_HPP
#define BITPACK_CORE_COMPOSITE_HPP

// Codecs built from member codecs.
//
//   std::array<T, N>     N fields of width(T), element i at offset + i*width(T)
//   std::tuple<Ts...>    members back to back in declaration order
//   std::pair<A, B>      first, then second
//
// No padding is inserted anywhere. Each composite checks its whole width
// up front, so a call that does not fit writes nothing.

#include <array>
#include <cstddef>
#include <tuple>
#include <utility>

#include "bitpack/core/checks.hpp"
#include "bitpack/core/codec.hpp"

namespace bitpack {

template <Packed T, std::size_t N>
struct Codec<std::array<T, N>> {
  using value_type = std::array<T, N>;

  static constexpr std::size_t element_width = Codec<T>::width;
  static constexpr std::size_t width = N * element_width;

  static value_type unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    return unpackElements(Bytes, Offset, std::make_index_sequence<N>{});
  }

  static void pack(value_type Val, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
    for (std::size_t I = 0; I < N; ++I)
      Codec<T>::pack(std::move(Val[I]), Bytes, Offset + I * element_width);
  }

private:
  template <std::size_t... I>
  static value_type unpackElements([[maybe_unused]] ByteView Bytes,
                                   [[maybe_unused]] std::size_t Offset,
                                   std::index_sequence<I...>) {
    // Braced initializers are evaluated left to right.
    return value_type{{Codec<T>::unpack(Bytes, Offset + I * element_width)...}};
  }
};

// Empty tuple: zero bits, ends the head/tail recursion below. The offset
// must still lie within the buffer.
template <>
struct Codec<std::tuple<>> {
  static constexpr std::size_t width = 0;

  static std::tuple<> unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    return {};
  }

  static void pack(std::tuple<>, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
  }
};

template <Packed Head, Packed... Tail>
struct Codec<std::tuple<Head, Tail...>> {
  using value_type = std::tuple<Head, Tail...>;
  using tail_type = std::tuple<Tail...>;

  static constexpr std::size_t head_width = Codec<Head>::width;
  static constexpr std::size_t width = head_width + Codec<tail_type>::width;

  static value_type unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    Head H = Codec<Head>::unpack(Bytes, Offset);
    return std::tuple_cat(std::tuple<Head>(std::move(H)),
                          Codec<tail_type>::unpack(Bytes, Offset + head_width));
  }

  static void pack(value_type Val, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
    std::apply(
        [&](Head &&H, Tail &&...Rest) {
          Codec<Head>::pack(std::move(H), Bytes, Offset);
          Codec<tail_type>::pack(tail_type(std::move(Rest)...), Bytes,
                                 Offset + head_width);
        },
        std::move(Val));
  }
};

template <Packed First, Packed Second>
struct Codec<std::pair<First, Second>> {
  using value_type = std::pair<First, Second>;

  static constexpr std::size_t width =
      Codec<First>::width + Codec<Second>::width;

  static value_type unpack(ByteView Bytes, std::size_t Offset) {
    requireCapacity("unpack", Bytes.size(), Offset, width);
    First A = Codec<First>::unpack(Bytes, Offset);
    Second B = Codec<Second>::unpack(Bytes, Offset + Codec<First>::width);
    return value_type(std::move(A), std::move(B));
  }

  static void pack(value_type Val, ByteSpan Bytes, std::size_t Offset) {
    requireCapacity("pack", Bytes.size(), Offset, width);
    Codec<First>::pack(std::move(Val.first), Bytes, Offset);
    Codec<Second>::pack(std::move(Val.second), Bytes,
                        Offset + Codec<First>::width);
  }
};

} // namespace bitpack

#endif // BITPACK_CORE_COMPOSITE_HPP
