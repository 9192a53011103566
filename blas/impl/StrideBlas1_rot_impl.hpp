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
#ifndef STRIDEBLAS1_ROT_IMPL_HPP_
#define STRIDEBLAS1_ROT_IMPL_HPP_

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>
#include <StrideBlas_VectorView.hpp>

namespace StrideBlas {
namespace Impl {

///
/// Serial Internal Impl
/// ====================
///
/// Applies the plane rotation
///
///   [ x(i) ]    [  c  s ] [ x(i) ]
///   [ y(i) ] := [ -s  c ] [ y(i) ]
///
/// for i = 0..n-1 in increasing order.  Both x(i) and y(i) are read before
/// either is written, which keeps the update well defined when x and y
/// alias the same storage.  c and s are not required to satisfy
/// c^2 + s^2 = 1.
struct SerialRotInternal {
  template <typename ScalarType, typename ValueType>
  KOKKOS_INLINE_FUNCTION static int invoke(const VectorView<ValueType>& x,
                                           const VectorView<ValueType>& y,
                                           const ScalarType c,
                                           const ScalarType s) {
    typedef std::remove_const_t<ValueType> value_type;
    typedef typename VectorView<ValueType>::ordinal_type ordinal_type;

    const ordinal_type n = x.extent(0);
    for (ordinal_type i = 0; i < n; ++i) {
      const value_type chi1 = x(i);
      const value_type chi2 = y(i);
      x(i) = c * chi1 + s * chi2;
      y(i) = c * chi2 - s * chi1;
    }
    return 0;
  }
};

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS1_ROT_IMPL_HPP_
