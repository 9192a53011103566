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
#ifndef STRIDEBLAS1_SCAL_IMPL_HPP_
#define STRIDEBLAS1_SCAL_IMPL_HPP_

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>
#include <StrideBlas_VectorView.hpp>

namespace StrideBlas {
namespace Impl {

///
/// Serial Internal Impl
/// ====================
///
/// x(i) = alpha * x(i) for i = 0..n-1.  Every step reads the current
/// value of its cell, so with a zero increment the single cell is scaled
/// n times.  No value of alpha is special-cased.
struct SerialScalInternal {
  template <typename ScalarType, typename ValueType>
  KOKKOS_INLINE_FUNCTION static int invoke(const ScalarType alpha,
                                           const VectorView<ValueType>& x) {
    typedef typename VectorView<ValueType>::ordinal_type ordinal_type;

    const ordinal_type n = x.extent(0);
    for (ordinal_type i = 0; i < n; ++i) x(i) = alpha * x(i);
    return 0;
  }
};

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS1_SCAL_IMPL_HPP_
