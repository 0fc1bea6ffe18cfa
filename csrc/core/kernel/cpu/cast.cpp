/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cast.cpp
 */

#include <cstring>

#include "cpu_common.h"
#include "cpu_kernel.h"
namespace lmspark {
namespace cpu {

static float half_to_float(uint16_t h) {
  uint32_t sign = static_cast<uint32_t>(h & 0x8000) << 16;
  uint32_t exponent = (h >> 10) & 0x1f;
  uint32_t mantissa = h & 0x3ff;
  uint32_t bits;
  if (exponent == 0) {
    if (mantissa == 0) {
      bits = sign;
    } else {
      // subnormal, renormalize
      exponent = 127 - 15 + 1;
      while ((mantissa & 0x400) == 0) {
        mantissa <<= 1;
        exponent--;
      }
      mantissa &= 0x3ff;
      bits = sign | (exponent << 23) | (mantissa << 13);
    }
  } else if (exponent == 0x1f) {
    bits = sign | 0x7f800000 | (mantissa << 13);
  } else {
    bits = sign | ((exponent + 127 - 15) << 23) | (mantissa << 13);
  }
  float out;
  memcpy(&out, &bits, sizeof(out));
  return out;
}

void HalfToFloatKernel(float* out, const uint16_t* in, int64_t count) {
  parallel_for(count, [&](int64_t i) { out[i] = half_to_float(in[i]); });
}

}  // namespace cpu
}  // namespace lmspark
