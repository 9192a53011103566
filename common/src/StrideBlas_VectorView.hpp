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

/// \file StrideBlas_VectorView.hpp
/// \brief Non-owning strided view of a logical vector inside a caller
///   buffer.

#ifndef STRIDEBLAS_VECTORVIEW_HPP_
#define STRIDEBLAS_VECTORVIEW_HPP_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>

#include <StrideBlas_config.h>
#include <Kokkos_Core.hpp>
#include <StrideBlas_Error.hpp>

namespace StrideBlas {
namespace Impl {

// |v| as an unsigned value; well defined for INT64_MIN.
inline std::uint64_t unsigned_magnitude(const std::int64_t v) {
  return v < 0 ? std::uint64_t(-(v + 1)) + 1 : std::uint64_t(v);
}

/// \brief True iff positions offset + i*inc, 0 <= i < n, all lie in
///   [0, span).  Requires n > 0.
///
/// The last position is never formed; the n-1 steps are compared against
/// the room left between offset and the edge of the buffer the walk heads
/// for, so no product can overflow.
inline bool strided_range_fits(const std::size_t span,
                               const std::int64_t offset, const std::int64_t n,
                               const std::int64_t inc) {
  if (offset < 0 || std::uint64_t(offset) >= std::uint64_t(span)) return false;
  if (inc == 0 || n == 1) return true;

  const std::uint64_t steps = std::uint64_t(n - 1);
  const std::uint64_t room =
      inc > 0 ? std::uint64_t(span) - 1 - std::uint64_t(offset)
              : std::uint64_t(offset);
  return steps <= room / unsigned_magnitude(inc);
}

}  // namespace Impl

/// \class VectorView
/// \brief Logical vector of extent n whose element i lives at
///   base + i * increment.
///
/// The increment may be positive, negative or zero.  With a zero
/// increment every logical index names the same cell.  A VectorView never
/// owns or allocates memory; it is valid only while the buffer it was
/// built from is alive.
///
/// \tparam Scalar float or double, possibly const-qualified.
template <class Scalar>
class VectorView {
  static_assert(std::is_floating_point<std::remove_const_t<Scalar>>::value,
                "StrideBlas::VectorView: Scalar must be a real floating-point "
                "type.");

 public:
  typedef Scalar value_type;
  typedef std::remove_const_t<Scalar> non_const_value_type;
  typedef const non_const_value_type const_value_type;
  typedef std::int64_t ordinal_type;
  typedef VectorView<const_value_type> const_type;

  enum : int { rank = 1 };

  KOKKOS_DEFAULTED_FUNCTION VectorView() = default;

  /// \brief Unchecked view: the caller guarantees that base + i * inc is
  ///   addressable for all 0 <= i < n.
  KOKKOS_INLINE_FUNCTION
  VectorView(Scalar* base, const ordinal_type n, const ordinal_type inc)
      : base_(base), n_(n), inc_(inc) {}

  /// \brief Checked view over a buffer of \c span elements with element 0
  ///   at buffer[offset].
  ///
  /// Throws DimensionError if n is negative or if any of the n accesses
  /// would fall outside [0, span).  \c label only names the view in the
  /// error message.
  VectorView(const std::string& label, Scalar* buffer, const std::size_t span,
             const ordinal_type offset, const ordinal_type n,
             const ordinal_type inc)
      : base_(buffer), n_(n), inc_(inc) {
    if (n < 0) {
      std::ostringstream os;
      os << "StrideBlas::VectorView(\"" << label
         << "\"): extent must be non-negative, got n = " << n;
      Impl::throw_dimension_error(DimensionErrorKind::negative_length,
                                  os.str());
    }
    if (n == 0) return;

    if (buffer == nullptr ||
        !Impl::strided_range_fits(span, offset, n, inc)) {
      std::ostringstream os;
      os << "StrideBlas::VectorView(\"" << label << "\"): buffer of " << span
         << " elements cannot hold n = " << n << " elements with increment "
         << inc << " starting at offset " << offset;
      Impl::throw_dimension_error(DimensionErrorKind::buffer_too_small,
                                  os.str());
    }
    base_ = buffer + offset;
  }

  /// \brief A view of non-const values converts to a view of const values.
  template <class OtherScalar,
            typename std::enable_if<
                std::is_convertible<OtherScalar*, Scalar*>::value &&
                    !std::is_same<OtherScalar, Scalar>::value,
                bool>::type = true>
  KOKKOS_INLINE_FUNCTION VectorView(const VectorView<OtherScalar>& other)
      : base_(other.data()), n_(other.extent(0)), inc_(other.increment()) {}

  KOKKOS_INLINE_FUNCTION constexpr ordinal_type extent(const int /*r*/) const {
    return n_;
  }
  KOKKOS_INLINE_FUNCTION constexpr ordinal_type increment() const {
    return inc_;
  }
  KOKKOS_INLINE_FUNCTION constexpr Scalar* data() const { return base_; }

  KOKKOS_INLINE_FUNCTION Scalar& operator()(const ordinal_type i) const {
#ifdef STRIDEBLAS_ENABLE_DEBUG_BOUNDS_CHECK
    if (i < 0 || i >= n_)
      Kokkos::abort("StrideBlas::VectorView: index out of range");
#endif
    return base_[i * inc_];
  }

  KOKKOS_INLINE_FUNCTION non_const_value_type element(
      const ordinal_type i) const {
    return (*this)(i);
  }

  KOKKOS_INLINE_FUNCTION void set(const ordinal_type i,
                                  const non_const_value_type v) const {
    static_assert(!std::is_const<Scalar>::value,
                  "StrideBlas::VectorView::set: view of const values.");
    (*this)(i) = v;
  }

 private:
  Scalar* base_        = nullptr;
  ordinal_type n_      = 0;
  ordinal_type inc_    = 0;
};

template <class T>
struct is_vector_view : std::false_type {};
template <class Scalar>
struct is_vector_view<VectorView<Scalar>> : std::true_type {};
template <class T>
constexpr inline bool is_vector_view_v = is_vector_view<T>::value;

template <class Scalar>
VectorView<Scalar> make_vector_view(const VectorView<Scalar>& X) {
  return X;
}

/// \brief View the elements of a rank-1 host-accessible Kokkos::View.
///
/// Any layout is accepted; the view's stride becomes the increment.
template <class XV>
VectorView<typename XV::value_type> make_vector_view(const XV& X) {
  static_assert(Kokkos::is_view<XV>::value,
                "StrideBlas::make_vector_view: XV is not a Kokkos::View.");
  static_assert(XV::rank == 1,
                "StrideBlas::make_vector_view: XV is not rank 1.");
  static_assert(Kokkos::SpaceAccessibility<
                    Kokkos::HostSpace, typename XV::memory_space>::accessible,
                "StrideBlas::make_vector_view: XV memory space needs to be "
                "accessible from Kokkos::HostSpace.");
  typedef VectorView<typename XV::value_type> vector_type;
  typedef typename vector_type::ordinal_type ordinal_type;
  return vector_type(X.data(), static_cast<ordinal_type>(X.extent(0)),
                     static_cast<ordinal_type>(X.stride(0)));
}

/// \brief Checked view following the reference BLAS argument convention.
///
/// \c buffer is the start of the caller's array.  For a negative increment
/// logical element 0 is the highest address touched, (n-1)*|inc|, and
/// subsequent elements walk down to buffer[0].
template <class Scalar>
VectorView<Scalar> make_blas_vector_view(const std::string& label,
                                         Scalar* buffer,
                                         const std::size_t span,
                                         const std::int64_t n,
                                         const std::int64_t inc) {
  if (inc >= 0 || n <= 1)
    return VectorView<Scalar>(label, buffer, span, 0, n, inc);

  // Element 0 sits at (n-1)*|inc|, which must lie below span.
  const std::uint64_t steps = std::uint64_t(n - 1);
  const std::uint64_t mag   = Impl::unsigned_magnitude(inc);
  if (span == 0 || steps > (std::uint64_t(span) - 1) / mag ||
      steps > std::uint64_t(std::numeric_limits<std::int64_t>::max()) / mag) {
    std::ostringstream os;
    os << "StrideBlas::VectorView(\"" << label << "\"): buffer of " << span
       << " elements cannot hold n = " << n << " elements with increment "
       << inc;
    Impl::throw_dimension_error(DimensionErrorKind::buffer_too_small,
                                os.str());
  }
  const std::int64_t offset = static_cast<std::int64_t>(steps * mag);
  return VectorView<Scalar>(label, buffer, span, offset, n, inc);
}

}  // namespace StrideBlas

#endif  // STRIDEBLAS_VECTORVIEW_HPP_
