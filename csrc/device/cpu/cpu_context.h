/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cpu_context.h
 */

#pragma once

#include <common/device_context.h>
#include <core/kernel/cpu/cpu_common.h>

#include <dnnl.hpp>
namespace lmspark {

class DNNLEngine {
 public:
  static DNNLEngine& GetInstance() {
    static DNNLEngine myInstance;
    return myInstance;
  }
  DNNLEngine(DNNLEngine const&) = delete;
  DNNLEngine(DNNLEngine&&) = delete;
  DNNLEngine& operator=(DNNLEngine const&) = delete;
  DNNLEngine& operator=(DNNLEngine&&) = delete;
  dnnl::engine& GetEngine() { return dnnl_engine_; }

 protected:
  DNNLEngine() : dnnl_engine_(dnnl::engine::kind::cpu, 0) {}
  ~DNNLEngine() {}

 private:
  dnnl::engine dnnl_engine_;
};

class CPUContext : public DeviceContext {
 public:
  CPUContext();
  ~CPUContext() override = default;

  void SetNumThreads(int num_threads) override;
  int GetNumThread() const override { return nthread_; }
  DeviceType GetDeviceType() const override { return DeviceType::CPU; }

  dnnl::stream& GetStream() { return stream_; }
  const dnnl::stream& GetStream() const { return stream_; }

  void Synchronize() const override;

 private:
  int nthread_ = 1;
  dnnl::stream stream_;
};

}  // namespace lmspark
