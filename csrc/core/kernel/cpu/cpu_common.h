/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cpu_common.h
 */

#pragma once

#include <omp.h>

#include <cstdint>

namespace lmspark {
namespace cpu {

inline int get_max_threads() { return omp_get_max_threads(); }

// static partition of [0, N) over the OpenMP team
template <typename F>
void parallel_for(const int64_t N, const F& f) {
#pragma omp parallel for
  for (int64_t i = 0; i < N; ++i) {
    f(i);
  }
}

}  // namespace cpu
}  // namespace lmspark
