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

#ifndef STRIDEBLAS_HOST_HPP_
#define STRIDEBLAS_HOST_HPP_

#include <cstddef>

#include <StrideBlas_config.h>

namespace StrideBlas {

/// \brief Level 1 routines with the reference BLAS calling convention:
///   a length n, the start of the caller's array, its size in elements
///   (x_span) and an increment.
///
/// For a negative increment the first logical element is
/// x[(n-1)*|x_inc|] and the traversal walks down to x[0].  Arguments are
/// validated before any element is touched; violations throw
/// StrideBlas::DimensionError.
///
/// HostBlas<float> and HostBlas<double> are compiled into the library for
/// every scalar type the library is built for.
template <typename T>
struct HostBlas {
  static T asum(int n, const T* x, std::size_t x_span, int x_inc);

  static void scal(int n, const T alpha,
                   /* */ T* x, std::size_t x_span, int x_inc);

  static void rot(int n,
                  /* */ T* x, std::size_t x_span, int x_inc,
                  /* */ T* y, std::size_t y_span, int y_inc,
                  const T c, const T s);

  static void copy(int n,
                   const T* x, std::size_t x_span, int x_inc,
                   /* */ T* y, std::size_t y_span, int y_inc);

  static void rotg(T* a, T* b, T* c, T* s);
};

#if defined(STRIDEBLAS_INST_FLOAT) || !defined(STRIDEBLAS_ETI_ONLY)
extern template struct HostBlas<float>;
#endif
#if defined(STRIDEBLAS_INST_DOUBLE) || !defined(STRIDEBLAS_ETI_ONLY)
extern template struct HostBlas<double>;
#endif

}  // namespace StrideBlas

#endif  // STRIDEBLAS_HOST_HPP_
