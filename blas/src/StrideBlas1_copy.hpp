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

#ifndef STRIDEBLAS1_COPY_HPP_
#define STRIDEBLAS1_COPY_HPP_

#include <type_traits>

#include <StrideBlas_Error.hpp>
#include <StrideBlas1_copy_spec.hpp>

namespace StrideBlas {

/// \brief Y(i) := X(i) for i = 0..n-1.
///
/// \tparam XV StrideBlas::VectorView or rank-1 Kokkos::View
/// \tparam YV StrideBlas::VectorView or rank-1 Kokkos::View; must be
///   nonconst and have the same value type as XV
template <class XV, class YV>
void copy(const XV& X, const YV& Y) {
  static_assert(is_vector_view_v<XV> || Kokkos::is_view<XV>::value,
                "StrideBlas::copy: "
                "X is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(is_vector_view_v<YV> || Kokkos::is_view<YV>::value,
                "StrideBlas::copy: "
                "Y is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(XV::rank == 1 && YV::rank == 1,
                "StrideBlas::copy: X and Y must have rank 1.");
  static_assert(std::is_same<typename YV::value_type,
                             typename YV::non_const_value_type>::value,
                "StrideBlas::copy: Y is const.  It must be nonconst, "
                "because it is an output argument "
                "(we must be able to write to its entries).");
  static_assert(std::is_same<typename XV::non_const_value_type,
                             typename YV::non_const_value_type>::value,
                "StrideBlas::copy: X and Y must have the same value type.");

  Impl::check_non_negative_extent("copy", "X", X);
  Impl::check_non_negative_extent("copy", "Y", Y);
  Impl::check_same_extent("copy", X, Y);

  typedef typename YV::non_const_value_type scalar_type;

  VectorView<const scalar_type> X_internal = make_vector_view(X);
  VectorView<scalar_type> Y_internal       = make_vector_view(Y);
  Impl::Copy<scalar_type>::copy(X_internal, Y_internal);
}

}  // namespace StrideBlas

#endif  // STRIDEBLAS1_COPY_HPP_
