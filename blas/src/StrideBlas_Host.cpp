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

#include "StrideBlas_Host.hpp"

#include <StrideBlas_VectorView.hpp>
#include <StrideBlas1_asum.hpp>
#include <StrideBlas1_copy.hpp>
#include <StrideBlas1_rot.hpp>
#include <StrideBlas1_rotg.hpp>
#include <StrideBlas1_scal.hpp>

namespace StrideBlas {

template <typename T>
T HostBlas<T>::asum(int n, const T* x, std::size_t x_span, int x_inc) {
  const VectorView<const T> X = make_blas_vector_view("x", x, x_span, n, x_inc);
  return StrideBlas::asum(X);
}

template <typename T>
void HostBlas<T>::scal(int n, const T alpha, T* x, std::size_t x_span,
                       int x_inc) {
  const VectorView<T> X = make_blas_vector_view("x", x, x_span, n, x_inc);
  StrideBlas::scal(alpha, X);
}

template <typename T>
void HostBlas<T>::rot(int n, T* x, std::size_t x_span, int x_inc, T* y,
                      std::size_t y_span, int y_inc, const T c, const T s) {
  // Both views are validated before either vector is modified.
  const VectorView<T> X = make_blas_vector_view("x", x, x_span, n, x_inc);
  const VectorView<T> Y = make_blas_vector_view("y", y, y_span, n, y_inc);
  StrideBlas::rot(X, Y, c, s);
}

template <typename T>
void HostBlas<T>::copy(int n, const T* x, std::size_t x_span, int x_inc, T* y,
                       std::size_t y_span, int y_inc) {
  const VectorView<const T> X = make_blas_vector_view("x", x, x_span, n, x_inc);
  const VectorView<T> Y       = make_blas_vector_view("y", y, y_span, n, y_inc);
  StrideBlas::copy(X, Y);
}

template <typename T>
void HostBlas<T>::rotg(T* a, T* b, T* c, T* s) {
  StrideBlas::rotg(*a, *b, *c, *s);
}

#if defined(STRIDEBLAS_INST_FLOAT) || !defined(STRIDEBLAS_ETI_ONLY)
template struct HostBlas<float>;
#endif
#if defined(STRIDEBLAS_INST_DOUBLE) || !defined(STRIDEBLAS_ETI_ONLY)
template struct HostBlas<double>;
#endif

}  // namespace StrideBlas
