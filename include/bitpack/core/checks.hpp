#ifndef BITPACK_CORE_CHECKS_HPP
#define BITPACK_CORE_CHECKS_HPP

// Buffer capacity precondition.
//
// Every pack/unpack needs offset + width <= 8 * bytes. A call that
// breaks this is a programmer error: it is detected before any byte is
// touched, reported, and the process halts. Which builds perform the
// check is a compile-time policy.

#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

namespace bitpack {

template <typename C>
concept CheckPolicy = requires {
  { C::enabled } -> std::convertible_to<bool>;
};

namespace checks {

// Check every call. The default.
struct Always {
  static constexpr bool enabled = true;
};

// Check only in builds without NDEBUG.
struct DebugOnly {
#ifdef NDEBUG
  static constexpr bool enabled = false;
#else
  static constexpr bool enabled = true;
#endif
};

#if defined(BITPACK_DEBUG_ONLY_CHECKS)
using Default = DebugOnly;
#else
using Default = Always;
#endif

static_assert(CheckPolicy<Always>);
static_assert(CheckPolicy<DebugOnly>);

} // namespace checks

// What a failed check was asked to do.
struct CapacityViolation {
  const char *Operation; // "pack" or "unpack"
  std::size_t Width;
  std::size_t Offset;
  std::size_t BufferBytes;
};

// Called before the process halts. A handler may throw to unwind out of
// the failing call; if it returns, the halt proceeds.
using ViolationHandler = void (*)(const CapacityViolation &);

namespace detail {

inline std::atomic<ViolationHandler> &violationHandlerSlot() {
  static std::atomic<ViolationHandler> Slot{nullptr};
  return Slot;
}

[[noreturn]] inline void capacityViolation(const CapacityViolation &V) {
  if (ViolationHandler H = violationHandlerSlot().load())
    H(V);
  std::fprintf(stderr,
               "bitpack: %s of %zu-bit value at bit offset %zu overruns "
               "%zu-byte buffer\n",
               V.Operation, V.Width, V.Offset, V.BufferBytes);
  std::abort();
}

} // namespace detail

// Installs H and returns the previous handler. nullptr restores the
// plain diagnostic.
inline ViolationHandler setViolationHandler(ViolationHandler H) {
  return detail::violationHandlerSlot().exchange(H);
}

inline ViolationHandler violationHandler() {
  return detail::violationHandlerSlot().load();
}

// True when Width bits starting at bit Offset fit in NumBytes bytes.
constexpr bool hasCapacity(std::size_t NumBytes, std::size_t Offset,
                           std::size_t Width) noexcept {
  const std::size_t Bits = NumBytes * 8;
  return Offset <= Bits && Bits - Offset >= Width;
}

template <CheckPolicy Policy = checks::Default>
inline void requireCapacity(const char *Operation, std::size_t NumBytes,
                            std::size_t Offset, std::size_t Width) {
  if constexpr (Policy::enabled) {
    if (!hasCapacity(NumBytes, Offset, Width))
      detail::capacityViolation({Operation, Width, Offset, NumBytes});
  }
}

} // namespace bitpack

#endif // BITPACK_CORE_CHECKS_HPP
