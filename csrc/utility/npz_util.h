/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    npz_util.h
 */

#pragma once
#include <core/tensor/tensor.h>

#include <memory>
#include <string>

namespace lmspark {
namespace util {

// Only C order (row major) arrays are supported. Archives must be stored
// without compression, as np.savez writes them; np.savez_compressed
// archives are rejected. Failures throw LsModelIOException.
std::unique_ptr<LsTensor> npy_load(const std::string& file_path,
                                   const std::string& name,
                                   DeviceType device_type = DeviceType::CPU);
void npz_load(const std::string& file_path, TensorMap& data,
              DeviceType device_type = DeviceType::CPU);
void npz_loads(const std::string& bin_data, TensorMap& data,
               DeviceType device_type = DeviceType::CPU);

// version 1.0 .npy and stored .npz writers
void npy_save(const std::string& file_path, const LsTensor& tensor);
void npz_save(const std::string& file_path, const TensorMap& data);
}  // namespace util
}  // namespace lmspark
