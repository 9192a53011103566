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

#ifndef STRIDEBLAS1_SCAL_HPP_
#define STRIDEBLAS1_SCAL_HPP_

#include <type_traits>

#include <StrideBlas_Error.hpp>
#include <StrideBlas1_scal_spec.hpp>

namespace StrideBlas {

/// \brief X(i) := alpha * X(i), in place, for i = 0..n-1 in order.
///
/// alpha == 1 and alpha == 0 are not short-circuited; every entry is
/// multiplied.
///
/// \tparam XV StrideBlas::VectorView or rank-1 host-accessible Kokkos::View
///   of non-const float or double.
///
/// \param alpha [in] Scaling factor.
/// \param X [in/out] Vector to scale; a negative extent throws
///   DimensionError (negative_length).
template <class XV>
void scal(const typename XV::non_const_value_type& alpha, const XV& X) {
  static_assert(is_vector_view_v<XV> || Kokkos::is_view<XV>::value,
                "StrideBlas::scal: "
                "X is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(XV::rank == 1, "StrideBlas::scal: X must have rank 1.");
  static_assert(std::is_same<typename XV::value_type,
                             typename XV::non_const_value_type>::value,
                "StrideBlas::scal: X is const.  It must be nonconst, "
                "because it is an output argument "
                "(we must be able to write to its entries).");

  Impl::check_non_negative_extent("scal", "X", X);

  typedef typename XV::non_const_value_type scalar_type;

  VectorView<scalar_type> X_internal = make_vector_view(X);
  Impl::Scal<scalar_type>::scal(alpha, X_internal);
}

}  // namespace StrideBlas

#endif  // STRIDEBLAS1_SCAL_HPP_
