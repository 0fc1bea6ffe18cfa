/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    global_config.h
 */

#pragma once

#include <common/common.h>

#include <string>
#include <vector>

namespace lmspark {

/*!
 * @brief Process wide options. The environment is read once on first use.
 * Fields are setup state: ReloadFromEnv, MergeFrom and direct assignment
 * belong to process setup, before any model is built or run, and readers
 * take no lock.
 */
class GlobalConfig {
 public:
  static GlobalConfig& Instance();

  // re-read LMSPARK_CLIENT_MEM_FRACTION, LMSPARK_USE_AWS_EFA and
  // LMSPARK_IS_WORKER
  void ReloadFromEnv();
  // only fields present in the GlobalConfigProto text file change
  LsStatus MergeFromTextFile(const std::string& path);
  LsStatus MergeFrom(const GlobalConfigProto& proto);
  std::string ToString() const;

  // memory
  float client_mem_fraction = 0.9f;
  // compilation and profiling
  int autotune_level = 4;
  int delete_remote_buffers_threshold = 200;
  int compile_random_seed = 42;
  int runtime_random_seed = 42;
  bool shard_parallel_sync_for_timer = false;
  bool debug_with_pipeshard_runtime = false;
  bool profile_with_whole_cluster = true;
  int profile_timeout = 500;
  int profile_maximum_retry = 2;
  // empty when unset
  std::vector<int> overwrite_submesh_choices;
  // pipeline
  bool always_donate_micro_batch_vars = true;
  bool pipeline_check_alive = true;
  bool pipeline_sync_for_timer = false;
  bool pipeline_distributed_compile = true;
  bool pipeline_use_signal_send_recv = false;
  bool use_scatter_gather = true;
  bool eagerly_create_communicators = true;
  bool use_memzero_for_gradient_accumulation = false;
  // "send_recv" or "broadcast"
  std::string resharding_mode = "send_recv";
  bool remat_using_while = false;
  // benchmark and debug
  bool use_dummy_value_for_benchmarking = false;
  bool print_compilation_time = false;
  std::string default_namespace_prefix = "lmspark-train";
  std::string unittest_namespace_prefix = "lmspark-unittest";
  // cluster
  bool use_aws_efa = false;
  bool is_worker = false;

 private:
  GlobalConfig();
  DISABLE_COPY_AND_ASSIGN(GlobalConfig);
};

}  // namespace lmspark
