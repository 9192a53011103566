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
#ifndef STRIDEBLAS1_ASUM_IMPL_HPP_
#define STRIDEBLAS1_ASUM_IMPL_HPP_

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>
#include <StrideBlas_VectorView.hpp>

namespace StrideBlas {
namespace Impl {

///
/// Serial Internal Impl
/// ====================
///
/// sum_i |x(i)|, accumulated left to right in the precision of x.  The
/// order is fixed so the result is bit-reproducible against a naive loop.
struct SerialAsumInternal {
  template <typename ValueType>
  KOKKOS_INLINE_FUNCTION static std::remove_const_t<ValueType> invoke(
      const VectorView<ValueType>& x) {
    typedef std::remove_const_t<ValueType> value_type;
    typedef typename VectorView<ValueType>::ordinal_type ordinal_type;

    value_type sum(0);
    const ordinal_type n = x.extent(0);
    for (ordinal_type i = 0; i < n; ++i) sum += Kokkos::abs(x(i));
    return sum;
  }
};

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS1_ASUM_IMPL_HPP_
