/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cpu_context.cpp
 */

#include "device/cpu/cpu_context.h"

namespace lmspark {

CPUContext::CPUContext() : stream_(DNNLEngine::GetInstance().GetEngine()) {
  SetNumThreads(cpu::get_max_threads());
}

void CPUContext::SetNumThreads(int num_threads) {
  if (num_threads <= 0) {
    LOG(WARNING) << "CPUContext: invalid thread number " << num_threads
                 << ", keep " << nthread_;
    return;
  }
  nthread_ = num_threads;
  omp_set_num_threads(num_threads);
}

void CPUContext::Synchronize() const {
  dnnl::stream* s_ptr = const_cast<dnnl::stream*>(&stream_);
  s_ptr->wait();
}

}  // namespace lmspark
