/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    layernorm.cpp
 */

#include <cmath>
#include <vector>

#include "cpu_common.h"
#include "cpu_kernel.h"
namespace lmspark {
namespace cpu {

static void vNorm(int n, const float* input, float* array, const float* gamma,
                  const float* beta, const float* bias, float eps) {
  std::vector<float> local_out(n);
  double mean = 0., variance = 0.;
  for (int i = 0; i < n; i++) {
    local_out[i] = bias ? input[i] + bias[i] : input[i];
    mean += local_out[i];
  }
  mean /= n;
  // two pass variance, E[x^2] - E[x]^2 loses too much on large offsets
  for (int i = 0; i < n; i++) {
    double diff = local_out[i] - mean;
    variance += diff * diff;
  }
  variance /= n;
  float inv_std = 1.f / sqrtf(static_cast<float>(variance) + eps);
  for (int i = 0; i < n; i++) {
    array[i] = gamma[i] * (local_out[i] - static_cast<float>(mean)) * inv_std +
               beta[i];
  }
}

template <>
void LayerNormKernel<float>(float* data_out, const float* data_in,
                            const float* bias, const float* gamma,
                            const float* beta, int m, int n, float eps) {
  parallel_for(m, [&](int i) {
    vNorm(n, data_in + static_cast<int64_t>(i) * n,
          data_out + static_cast<int64_t>(i) * n, gamma, beta, bias, eps);
  });
}

}  // namespace cpu
}  // namespace lmspark
