#ifndef BITPACK_HPP
#define BITPACK_HPP

#include "bitpack/core/bits.hpp"
#include "bitpack/core/checks.hpp"
#include "bitpack/core/codec.hpp"
#include "bitpack/core/composite.hpp"
#include "bitpack/core/primitive.hpp"

#endif // BITPACK_HPP
