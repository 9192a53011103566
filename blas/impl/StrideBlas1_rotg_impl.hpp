//@HEADER
// ************************************************************************
//
//                        Kokkos v. 4.0
//       Copyright (2022) National Technology & Engineering
//               Solutions of Sandia, LLC (NTESS).
//
// Under the terms of Contract DE-NA0003525 with NTESS,
// the U.S. Government retains certain rights in this software.
//
// Part of Kokkos, under the Apache License v2.0 with LLVM Exceptions.
// See https://kokkos.org/LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//@HEADER

#ifndef STRIDEBLAS1_ROTG_IMPL_HPP_
#define STRIDEBLAS1_ROTG_IMPL_HPP_

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>

namespace StrideBlas {
namespace Impl {

///
/// Serial Internal Impl
/// ====================
///
/// Givens rotation with safe scaling: a and b are divided by a factor
/// clamped to [safmin, 1/safmin] before squaring, so neither overflow nor
/// underflow of a^2 + b^2 spoils r.  On exit a holds r, which carries the
/// sign of the larger input, and b holds the reconstruction value z.
struct SerialRotgInternal {
  template <typename ValueType>
  KOKKOS_INLINE_FUNCTION static int invoke(ValueType& a, ValueType& b,
                                           ValueType& c, ValueType& s) {
    const ValueType zero(0), one(1);
    const ValueType safmin = Kokkos::Experimental::norm_min_v<ValueType>;
    const ValueType safmax = one / safmin;

    const ValueType anorm = Kokkos::abs(a);
    const ValueType bnorm = Kokkos::abs(b);

    if (bnorm == zero) {
      // (a, 0) is already on the axis; r = a.
      c = one;
      s = zero;
      b = zero;
      return 0;
    }
    if (anorm == zero) {
      c = zero;
      s = one;
      a = b;
      b = one;
      return 0;
    }

    const ValueType scl =
        Kokkos::min(safmax, Kokkos::max(safmin, Kokkos::max(anorm, bnorm)));
    const ValueType as = a / scl, bs = b / scl;
    const ValueType r  = Kokkos::copysign(
        scl * Kokkos::sqrt(as * as + bs * bs), anorm > bnorm ? a : b);
    c = a / r;
    s = b / r;

    // z = s when |a| > |b|, else 1/c (1 if c vanished).
    ValueType z = one;
    if (anorm > bnorm)
      z = s;
    else if (c != zero)
      z = one / c;

    a = r;
    b = z;
    return 0;
  }
};

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS1_ROTG_IMPL_HPP_
