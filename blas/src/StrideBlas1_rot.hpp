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

#ifndef STRIDEBLAS1_ROT_HPP_
#define STRIDEBLAS1_ROT_HPP_

#include <type_traits>

#include <StrideBlas_Error.hpp>
#include <StrideBlas1_rot_spec.hpp>

namespace StrideBlas {

/// \brief Apply the plane rotation (c, s) to the pair of vectors (X, Y):
///
///   X(i) := c * X(i) + s * Y(i)
///   Y(i) := c * Y(i) - s * X(i)
///
/// using the values of X(i) and Y(i) from before step i.  c and s are used
/// as given; they need not satisfy c^2 + s^2 = 1.
///
/// Throws DimensionError if either extent is negative (negative_length) or
/// if X and Y have different extents (length_mismatch).  Neither vector is
/// modified in that case.
template <class XV, class YV>
void rot(const XV& X, const YV& Y,
         const typename XV::non_const_value_type& c,
         const typename XV::non_const_value_type& s) {
  static_assert(is_vector_view_v<XV> || Kokkos::is_view<XV>::value,
                "StrideBlas::rot: "
                "X is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(is_vector_view_v<YV> || Kokkos::is_view<YV>::value,
                "StrideBlas::rot: "
                "Y is not a StrideBlas::VectorView or a Kokkos::View.");
  static_assert(XV::rank == 1 && YV::rank == 1,
                "StrideBlas::rot: X and Y must have rank 1.");
  static_assert(std::is_same<typename XV::value_type,
                             typename XV::non_const_value_type>::value &&
                    std::is_same<typename YV::value_type,
                                 typename YV::non_const_value_type>::value,
                "StrideBlas::rot: X and Y need to store non-const values");
  static_assert(std::is_same<typename XV::non_const_value_type,
                             typename YV::non_const_value_type>::value,
                "StrideBlas::rot: X and Y must have the same value type.");

  Impl::check_non_negative_extent("rot", "X", X);
  Impl::check_non_negative_extent("rot", "Y", Y);
  Impl::check_same_extent("rot", X, Y);

  typedef typename XV::non_const_value_type scalar_type;
  typedef VectorView<scalar_type> Vector_Internal;

  Vector_Internal X_(make_vector_view(X)), Y_(make_vector_view(Y));
  Impl::Rot<scalar_type>::rot(X_, Y_, c, s);
}

}  // namespace StrideBlas
#endif  // STRIDEBLAS1_ROT_HPP_
