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
#ifndef STRIDEBLAS1_COPY_IMPL_HPP_
#define STRIDEBLAS1_COPY_IMPL_HPP_

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>
#include <StrideBlas_VectorView.hpp>

namespace StrideBlas {
namespace Impl {

///
/// Serial Internal Impl
/// ====================
///
/// Entry-wise y(i) = x(i), in increasing index order.
struct SerialCopyInternal {
  template <typename XValueType, typename YValueType>
  KOKKOS_INLINE_FUNCTION static int invoke(const VectorView<XValueType>& x,
                                           const VectorView<YValueType>& y) {
    typedef typename VectorView<YValueType>::ordinal_type ordinal_type;

    const ordinal_type n = x.extent(0);
    for (ordinal_type i = 0; i < n; ++i) y(i) = x(i);
    return 0;
  }
};

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS1_COPY_IMPL_HPP_
