#ifndef BITPACK_CORE_BITS_HPP
#define BITPACK_CORE_BITS_HPP

// bits_t<N>: the unsigned integer type a packed field of N bits is
// carried in.
//
// Not a value type of its own, just the standard unsigned integer of
// exactly N bits. Signed codecs reinterpret through it. 128 bits needs
// unsigned __int128 (GCC and Clang on 64-bit targets).

#include <cstdint>
#include <type_traits>

#if defined(__SIZEOF_INT128__)
#define BITPACK_HAS_INT128 1
#else
#define BITPACK_HAS_INT128 0
#endif

namespace bitpack {

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N == 8 || N == 16 || N == 32 || N == 64 || N == 128,
                "packed integers are 8, 16, 32, 64 or 128 bits wide");
};

template <>
struct BitsStorage<8> {
  using type = uint8_t;
};

template <>
struct BitsStorage<16> {
  using type = uint16_t;
};

template <>
struct BitsStorage<32> {
  using type = uint32_t;
};

template <>
struct BitsStorage<64> {
  using type = uint64_t;
};

#if BITPACK_HAS_INT128
template <>
struct BitsStorage<128> {
  using type = unsigned __int128;
};
#endif

// The integer types with a packed codec. Spelled out instead of using
// std::is_integral so that __int128 is accepted in strict -std=c++20
// mode and char/wchar_t/char8_t stay excluded.
template <typename T>
struct IsPackedUnsigned : std::false_type {};
template <> struct IsPackedUnsigned<unsigned char> : std::true_type {};
template <> struct IsPackedUnsigned<unsigned short> : std::true_type {};
template <> struct IsPackedUnsigned<unsigned int> : std::true_type {};
template <> struct IsPackedUnsigned<unsigned long> : std::true_type {};
template <> struct IsPackedUnsigned<unsigned long long> : std::true_type {};

template <typename T>
struct IsPackedSigned : std::false_type {};
template <> struct IsPackedSigned<signed char> : std::true_type {};
template <> struct IsPackedSigned<short> : std::true_type {};
template <> struct IsPackedSigned<int> : std::true_type {};
template <> struct IsPackedSigned<long> : std::true_type {};
template <> struct IsPackedSigned<long long> : std::true_type {};

#if BITPACK_HAS_INT128
template <> struct IsPackedUnsigned<unsigned __int128> : std::true_type {};
template <> struct IsPackedSigned<__int128> : std::true_type {};
#endif

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

template <typename T>
concept UnsignedInteger = detail::IsPackedUnsigned<T>::value;

template <typename T>
concept SignedInteger = detail::IsPackedSigned<T>::value;

} // namespace bitpack

#endif // BITPACK_CORE_BITS_HPP
