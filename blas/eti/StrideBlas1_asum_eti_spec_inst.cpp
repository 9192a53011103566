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

#define STRIDEBLAS_IMPL_COMPILE_LIBRARY true
#include "StrideBlas_config.h"
#include "StrideBlas1_asum_spec.hpp"

namespace StrideBlas {
namespace Impl {
#if defined(STRIDEBLAS_INST_FLOAT)
STRIDEBLAS1_ASUM_ETI_SPEC_INST(float)
#endif
#if defined(STRIDEBLAS_INST_DOUBLE)
STRIDEBLAS1_ASUM_ETI_SPEC_INST(double)
#endif
}  // namespace Impl
}  // namespace StrideBlas
