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

#ifndef STRIDEBLAS_TESTUTILS_HPP
#define STRIDEBLAS_TESTUTILS_HPP

#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

namespace Test {

template <class T>
class epsilon {
 public:
  constexpr static double value = std::numeric_limits<T>::epsilon();
};

// Map the bit pattern of a finite float/double onto a monotone integer
// line so that adjacent representable values differ by one.
template <class T>
std::int64_t ordered_bits(const T v) {
  static_assert(std::is_floating_point<T>::value, "ordered_bits: not a float");
  if constexpr (std::is_same<T, float>::value) {
    std::int32_t i;
    std::memcpy(&i, &v, sizeof(i));
    return i < 0 ? std::int64_t(std::numeric_limits<std::int32_t>::min()) - i
                 : std::int64_t(i);
  } else {
    std::int64_t i;
    std::memcpy(&i, &v, sizeof(i));
    return i < 0 ? std::numeric_limits<std::int64_t>::min() - i : i;
  }
}

/// \brief Number of representable values between a and b; 0 iff a == b
///   (with +0 == -0).
template <class T>
std::int64_t ulp_distance(const T a, const T b) {
  const std::int64_t ia = ordered_bits(a);
  const std::int64_t ib = ordered_bits(b);
  return ia > ib ? ia - ib : ib - ia;
}

template <class T>
bool bitwise_equal(const T a, const T b) {
  return std::memcmp(&a, &b, sizeof(T)) == 0;
}

}  // namespace Test

#define EXPECT_WITHIN_ULP(val1, val2, ulps) \
  EXPECT_LE(::Test::ulp_distance((val1), (val2)), std::int64_t(ulps))

#endif  // STRIDEBLAS_TESTUTILS_HPP
