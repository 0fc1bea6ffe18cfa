/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    generate_context.h
 */

#pragma once

#include <common/common.h>

namespace lmspark {

class AttentionCache;

// per forward call state shared by all operators of a model
struct GenerateContext {
  int batch_size = 1;
  int seq_len = 0;
  // nullptr selects the causal no-cache path
  AttentionCache* cache = nullptr;
  bool output_attentions = false;
};

}  // namespace lmspark
