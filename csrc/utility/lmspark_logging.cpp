/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    lmspark_logging.cpp
 */
#include "lmspark_logging.h"

#include <common/env_config.h>

#include <mutex>
#include <string>

namespace lmspark {
namespace util {

static std::once_flag g_log_init_once;

void ls_init_log() {
  std::call_once(g_log_init_once, []() {
    if (!google::IsGoogleLoggingInitialized()) {
      google::InitGoogleLogging("lmspark");
      google::InstallFailureSignalHandler();
    }

    fLB::FLAGS_timestamp_in_logfile_name = true;
    fLB::FLAGS_alsologtostderr = false;
    fLI::FLAGS_stderrthreshold = google::ERROR;
    fLI::FLAGS_logbufsecs = 5;
    fLI::FLAGS_max_log_size = 10;

    std::string log_dir = EnvVarConfig::GetString("LMSPARK_LOG_DIR", "");
    if (log_dir.empty()) {
      fLB::FLAGS_logtostderr = true;
    } else {
      fLS::FLAGS_log_dir = log_dir;
      fLB::FLAGS_logtostderr = false;
    }

    int log_level = EnvVarConfig::GetInt("LMSPARK_LOG_LEVEL", google::WARNING);
    if (log_level < google::INFO or log_level > google::FATAL) {
      log_level = google::WARNING;
    }
    fLI::FLAGS_minloglevel = log_level;
  });
}

}  // namespace util
}  // namespace lmspark
