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

#ifndef STRIDEBLAS1_ASUM_HPP_
#define STRIDEBLAS1_ASUM_HPP_

#include <StrideBlas_Error.hpp>
#include <StrideBlas1_asum_spec.hpp>

namespace StrideBlas {

/// \brief Return the sum of the absolute values of the entries of X.
///
/// The sum is accumulated in the precision of X, left to right over the
/// logical indices.  An empty X yields +0.
///
/// \tparam XV StrideBlas::VectorView or rank-1 host-accessible Kokkos::View
///   of float or double.
///
/// \param X [in] Input vector.
///
/// Throws DimensionError (negative_length) if X has a negative extent.
template <class XV>
typename XV::non_const_value_type asum(const XV& X) {
  static_assert(is_vector_view_v<XV> || Kokkos::is_view<XV>::value,
                "StrideBlas::asum: "
                "X is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(XV::rank == 1, "StrideBlas::asum: X must have rank 1.");

  Impl::check_non_negative_extent("asum", "X", X);

  typedef typename XV::non_const_value_type scalar_type;
  typedef VectorView<const scalar_type> XV_Internal;

  XV_Internal X_internal = make_vector_view(X);
  return Impl::Asum<scalar_type>::asum(X_internal);
}

}  // namespace StrideBlas

#endif  // STRIDEBLAS1_ASUM_HPP_
