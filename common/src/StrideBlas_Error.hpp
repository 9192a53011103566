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

/// \file StrideBlas_Error.hpp
/// \brief Error reporting for caller-side precondition violations
///   (negative lengths, undersized buffers, mismatched vector lengths).

#ifndef STRIDEBLAS_ERROR_HPP_
#define STRIDEBLAS_ERROR_HPP_

#include <sstream>
#include <stdexcept>
#include <string>

namespace StrideBlas {

enum class DimensionErrorKind {
  negative_length,
  buffer_too_small,
  length_mismatch
};

inline const char* to_string(DimensionErrorKind kind) {
  switch (kind) {
    case DimensionErrorKind::negative_length: return "negative_length";
    case DimensionErrorKind::buffer_too_small: return "buffer_too_small";
    case DimensionErrorKind::length_mismatch: return "length_mismatch";
  }
  return "unknown";
}

/// \brief Thrown by the kernel front ends and the VectorView factories
///   before any element of the caller's buffers is touched.
class DimensionError : public std::runtime_error {
 public:
  DimensionError(DimensionErrorKind kind, const std::string& msg)
      : std::runtime_error(msg), kind_(kind) {}

  DimensionErrorKind kind() const noexcept { return kind_; }

 private:
  DimensionErrorKind kind_;
};

namespace Impl {

[[noreturn]] inline void throw_dimension_error(DimensionErrorKind kind,
                                               const std::string& msg) {
  throw DimensionError(kind, msg);
}

// A VectorView built with the unchecked constructor keeps whatever extent
// it was given, so the front ends reject a negative one themselves.
template <class XV>
void check_non_negative_extent(const char* routine, const char* name,
                               const XV& X) {
  const long long n = static_cast<long long>(X.extent(0));
  if (n < 0) {
    std::ostringstream os;
    os << "StrideBlas::" << routine << ": Extent of " << name
       << " must be non-negative: " << name << ": " << n;
    throw_dimension_error(DimensionErrorKind::negative_length, os.str());
  }
}

// Rot and copy consume two vectors of the same logical length.
template <class XV, class YV>
void check_same_extent(const char* routine, const XV& X, const YV& Y) {
  const long long nx = static_cast<long long>(X.extent(0));
  const long long ny = static_cast<long long>(Y.extent(0));
  if (nx != ny) {
    std::ostringstream os;
    os << "StrideBlas::" << routine
       << ": Dimensions of X and Y do not match: X: " << nx << ", Y: " << ny;
    throw_dimension_error(DimensionErrorKind::length_mismatch, os.str());
  }
}

}  // namespace Impl
}  // namespace StrideBlas

#endif  // STRIDEBLAS_ERROR_HPP_
