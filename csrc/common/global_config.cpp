/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    global_config.cpp
 */

#include "global_config.h"  // NOLINT

#include <common/env_config.h>
#include <utility/file_util.h>

#include <sstream>

namespace lmspark {

GlobalConfig& GlobalConfig::Instance() {
  static GlobalConfig config;
  return config;
}

GlobalConfig::GlobalConfig() { ReloadFromEnv(); }

void GlobalConfig::ReloadFromEnv() {
  client_mem_fraction =
      EnvVarConfig::GetFloat("LMSPARK_CLIENT_MEM_FRACTION", 0.9f);
  use_aws_efa = EnvVarConfig::GetBool("LMSPARK_USE_AWS_EFA", false);
  is_worker = EnvVarConfig::GetString("LMSPARK_IS_WORKER", "False") == "True";
}

LsStatus GlobalConfig::MergeFromTextFile(const std::string& path) {
  GlobalConfigProto proto;
  LS_CHECK_STATUS(util::ReadProtoFromTextFile(path, &proto));
  return MergeFrom(proto);
}

LsStatus GlobalConfig::MergeFrom(const GlobalConfigProto& proto) {
  if (proto.has_resharding_mode() and proto.resharding_mode() != "send_recv" and
      proto.resharding_mode() != "broadcast") {
    LOG(ERROR) << "GlobalConfig: invalid resharding_mode "
               << proto.resharding_mode()
               << ", expect send_recv or broadcast";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
#define LS_MERGE_FIELD(field) \
  if (proto.has_##field()) field = proto.field()
  LS_MERGE_FIELD(client_mem_fraction);
  LS_MERGE_FIELD(autotune_level);
  LS_MERGE_FIELD(delete_remote_buffers_threshold);
  LS_MERGE_FIELD(compile_random_seed);
  LS_MERGE_FIELD(runtime_random_seed);
  LS_MERGE_FIELD(shard_parallel_sync_for_timer);
  LS_MERGE_FIELD(debug_with_pipeshard_runtime);
  LS_MERGE_FIELD(profile_with_whole_cluster);
  LS_MERGE_FIELD(profile_timeout);
  LS_MERGE_FIELD(profile_maximum_retry);
  LS_MERGE_FIELD(always_donate_micro_batch_vars);
  LS_MERGE_FIELD(pipeline_check_alive);
  LS_MERGE_FIELD(pipeline_sync_for_timer);
  LS_MERGE_FIELD(pipeline_distributed_compile);
  LS_MERGE_FIELD(pipeline_use_signal_send_recv);
  LS_MERGE_FIELD(use_scatter_gather);
  LS_MERGE_FIELD(eagerly_create_communicators);
  LS_MERGE_FIELD(use_memzero_for_gradient_accumulation);
  LS_MERGE_FIELD(resharding_mode);
  LS_MERGE_FIELD(remat_using_while);
  LS_MERGE_FIELD(use_dummy_value_for_benchmarking);
  LS_MERGE_FIELD(print_compilation_time);
  LS_MERGE_FIELD(default_namespace_prefix);
  LS_MERGE_FIELD(unittest_namespace_prefix);
  LS_MERGE_FIELD(use_aws_efa);
  LS_MERGE_FIELD(is_worker);
#undef LS_MERGE_FIELD
  if (proto.overwrite_submesh_choices_size() > 0) {
    overwrite_submesh_choices.assign(proto.overwrite_submesh_choices().begin(),
                                     proto.overwrite_submesh_choices().end());
  }
  return LsStatus::LMSPARK_SUCCESS;
}

std::string GlobalConfig::ToString() const {
  std::stringstream ss;
  ss << std::boolalpha;
  ss << "client_mem_fraction: " << client_mem_fraction << "\n";
  ss << "autotune_level: " << autotune_level << "\n";
  ss << "delete_remote_buffers_threshold: " << delete_remote_buffers_threshold
     << "\n";
  ss << "compile_random_seed: " << compile_random_seed << "\n";
  ss << "runtime_random_seed: " << runtime_random_seed << "\n";
  ss << "shard_parallel_sync_for_timer: " << shard_parallel_sync_for_timer
     << "\n";
  ss << "debug_with_pipeshard_runtime: " << debug_with_pipeshard_runtime
     << "\n";
  ss << "profile_with_whole_cluster: " << profile_with_whole_cluster << "\n";
  ss << "profile_timeout: " << profile_timeout << "\n";
  ss << "profile_maximum_retry: " << profile_maximum_retry << "\n";
  ss << "overwrite_submesh_choices:";
  if (overwrite_submesh_choices.empty()) {
    ss << " unset";
  }
  for (int choice : overwrite_submesh_choices) {
    ss << " " << choice;
  }
  ss << "\n";
  ss << "always_donate_micro_batch_vars: " << always_donate_micro_batch_vars
     << "\n";
  ss << "pipeline_check_alive: " << pipeline_check_alive << "\n";
  ss << "pipeline_sync_for_timer: " << pipeline_sync_for_timer << "\n";
  ss << "pipeline_distributed_compile: " << pipeline_distributed_compile
     << "\n";
  ss << "pipeline_use_signal_send_recv: " << pipeline_use_signal_send_recv
     << "\n";
  ss << "use_scatter_gather: " << use_scatter_gather << "\n";
  ss << "eagerly_create_communicators: " << eagerly_create_communicators
     << "\n";
  ss << "use_memzero_for_gradient_accumulation: "
     << use_memzero_for_gradient_accumulation << "\n";
  ss << "resharding_mode: " << resharding_mode << "\n";
  ss << "remat_using_while: " << remat_using_while << "\n";
  ss << "use_dummy_value_for_benchmarking: "
     << use_dummy_value_for_benchmarking << "\n";
  ss << "print_compilation_time: " << print_compilation_time << "\n";
  ss << "default_namespace_prefix: " << default_namespace_prefix << "\n";
  ss << "unittest_namespace_prefix: " << unittest_namespace_prefix << "\n";
  ss << "use_aws_efa: " << use_aws_efa << "\n";
  ss << "is_worker: " << is_worker << "\n";
  return ss.str();
}

}  // namespace lmspark
