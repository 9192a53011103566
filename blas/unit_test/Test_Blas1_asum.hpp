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

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>
#include <Kokkos_Random.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include <StrideBlas1_asum.hpp>
#include <StrideBlas_TestUtils.hpp>

namespace Test {
template <class Scalar, class Device>
void impl_test_asum_identities() {
  // Empty vector: the result is +0, not -0.
  {
    Kokkos::View<Scalar*, Device> empty("empty", 0);
    const Scalar r = StrideBlas::asum(empty);
    EXPECT_EQ(r, Scalar(0));
    EXPECT_FALSE(std::signbit(r));
  }

  // Single element: |x|.
  {
    const Scalar values[] = {Scalar(-3.5), Scalar(0), Scalar(2.25),
                             Scalar(-0.0), std::numeric_limits<Scalar>::max(),
                             -std::numeric_limits<Scalar>::denorm_min()};
    for (Scalar v : values) {
      StrideBlas::VectorView<const Scalar> x(&v, 1, 1);
      EXPECT_TRUE(bitwise_equal(StrideBlas::asum(x), std::abs(v)));
    }
  }

  {
    Scalar buf[] = {-1, -2, 3};
    StrideBlas::VectorView<Scalar> x(buf, 3, 1);
    EXPECT_EQ(StrideBlas::asum(x), Scalar(6));
  }
}

template <class Scalar, class Device>
void impl_test_asum_strided() {
  Scalar buf[] = {1, -100, -2, -100, 4, -100, -8};

  // Every other element, forward and backward.
  StrideBlas::VectorView<Scalar> fwd("x", buf, 7, 0, 4, 2);
  EXPECT_EQ(StrideBlas::asum(fwd), Scalar(15));

  StrideBlas::VectorView<Scalar> bwd("x", buf, 7, 6, 4, -2);
  EXPECT_EQ(StrideBlas::asum(bwd), Scalar(15));

  // Zero increment reads the same cell n times.
  StrideBlas::VectorView<Scalar> same("x", buf, 7, 2, 5, 0);
  EXPECT_EQ(StrideBlas::asum(same), Scalar(10));
}

template <class Scalar, class Device>
void impl_test_asum_nonfinite() {
  const Scalar inf = std::numeric_limits<Scalar>::infinity();
  const Scalar nan = std::numeric_limits<Scalar>::quiet_NaN();

  Scalar with_nan[] = {1, nan, 2};
  EXPECT_TRUE(std::isnan(
      StrideBlas::asum(StrideBlas::VectorView<Scalar>(with_nan, 3, 1))));

  Scalar with_inf[] = {1, -inf, 2};
  EXPECT_EQ(StrideBlas::asum(StrideBlas::VectorView<Scalar>(with_inf, 3, 1)),
            inf);

  Scalar both_inf[] = {inf, -inf};
  EXPECT_EQ(StrideBlas::asum(StrideBlas::VectorView<Scalar>(both_inf, 2, 1)),
            inf);
}

// A view from the unchecked constructor with a negative extent is rejected
// at the call, not read as an empty vector.
template <class Scalar, class Device>
void impl_test_asum_negative_length() {
  Scalar buf[] = {1, 2};
  try {
    StrideBlas::asum(StrideBlas::VectorView<const Scalar>(buf, -1, 1));
    FAIL() << "asum accepted a negative extent";
  } catch (const StrideBlas::DimensionError& e) {
    EXPECT_EQ(e.kind(), StrideBlas::DimensionErrorKind::negative_length);
  }
}

template <class ViewTypeA, class Device>
void impl_test_asum(int N) {
  typedef typename ViewTypeA::value_type Scalar;

  typedef Kokkos::View<
      Scalar * [2],
      typename std::conditional<
          std::is_same<typename ViewTypeA::array_layout,
                       Kokkos::LayoutStride>::value,
          Kokkos::LayoutRight, Kokkos::LayoutLeft>::type,
      Device>
      BaseTypeA;

  BaseTypeA b_a("A", N);
  ViewTypeA a = Kokkos::subview(b_a, Kokkos::ALL(), 0);

  typename BaseTypeA::HostMirror h_b_a = Kokkos::create_mirror_view(b_a);
  typename ViewTypeA::HostMirror h_a = Kokkos::subview(h_b_a, Kokkos::ALL(), 0);

  Kokkos::Random_XorShift64_Pool<typename Device::execution_space> rand_pool(
      13718);
  Kokkos::fill_random(b_a, rand_pool, Scalar(-10), Scalar(10));
  Kokkos::fence();

  Kokkos::deep_copy(h_b_a, b_a);

  Scalar expected = 0;
  for (int i = 0; i < N; i++) expected += std::abs(h_a(i));

  const Scalar result = StrideBlas::asum(a);
  EXPECT_WITHIN_ULP(result, expected, 1);

  typename ViewTypeA::const_type c_a = a;
  EXPECT_WITHIN_ULP(StrideBlas::asum(c_a), expected, 1);
}
}  // namespace Test

template <class Scalar, class Device>
int test_asum() {
  typedef Kokkos::View<Scalar*, Kokkos::LayoutLeft, Device> view_type_a_ll;
  typedef Kokkos::View<Scalar*, Kokkos::LayoutStride, Device> view_type_a_ls;

  Test::impl_test_asum_identities<Scalar, Device>();
  Test::impl_test_asum_strided<Scalar, Device>();
  Test::impl_test_asum_nonfinite<Scalar, Device>();
  Test::impl_test_asum_negative_length<Scalar, Device>();

  for (int N : {0, 1, 2, 13, 61, 1024, 4097, 10000}) {
    Test::impl_test_asum<view_type_a_ll, Device>(N);
    Test::impl_test_asum<view_type_a_ls, Device>(N);
  }

  return 1;
}

#if defined(STRIDEBLAS_INST_FLOAT) || !defined(STRIDEBLAS_ETI_ONLY)
TEST_F(TestCategory, asum_float) {
  Kokkos::Profiling::pushRegion("StrideBlas::Test::asum_float");
  test_asum<float, TestExecSpace>();
  Kokkos::Profiling::popRegion();
}
#endif

#if defined(STRIDEBLAS_INST_DOUBLE) || !defined(STRIDEBLAS_ETI_ONLY)
TEST_F(TestCategory, asum_double) {
  Kokkos::Profiling::pushRegion("StrideBlas::Test::asum_double");
  test_asum<double, TestExecSpace>();
  Kokkos::Profiling::popRegion();
}
#endif
