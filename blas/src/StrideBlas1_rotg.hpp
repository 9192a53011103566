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

#ifndef STRIDEBLAS1_ROTG_HPP_
#define STRIDEBLAS1_ROTG_HPP_

#include <type_traits>

#include <StrideBlas1_rotg_spec.hpp>

namespace StrideBlas {

/// \brief Construct the Givens rotation (c, s) that zeroes b:
///
///   [  c  s ] [ a ]   [ r ]
///   [ -s  c ] [ b ] = [ 0 ]
///
/// On exit a is overwritten with r and b with the reference-BLAS value z
/// from which c and s can be recovered.
template <class Scalar>
void rotg(Scalar& a, Scalar& b, Scalar& c, Scalar& s) {
  static_assert(std::is_floating_point<Scalar>::value,
                "StrideBlas::rotg: Scalar must be float or double.");
  Impl::Rotg<Scalar>::rotg(a, b, c, s);
}

}  // namespace StrideBlas

#endif  // STRIDEBLAS1_ROTG_HPP_
