/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    file_util.cpp
 */

#include "file_util.h"  // NOLINT

#include <dirent.h>
#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>

namespace lmspark {
namespace util {

bool IsExists(const std::string& file_path) {
  struct stat buffer;
  return (stat(file_path.c_str(), &buffer) == 0);
}

bool IsDirectory(const std::string& path) {
  struct stat buffer;
  return stat(path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode);
}

bool MakeDirs(const std::string& path) {
  int status = mkdir(path.c_str(), 0777);
  if (status == 0 || (errno == EEXIST && IsDirectory(path))) {
    return true;
  } else if (errno == ENOENT) {
    std::size_t found = path.find_last_of('/');
    if (found != std::string::npos) {
      std::string parentDir = path.substr(0, found);
      if (!MakeDirs(parentDir)) {
        return false;
      }
      status = mkdir(path.c_str(), 0777);
      return (status == 0);
    }
  }
  return false;
}

std::vector<std::string> ListFiles(const std::string& dir) {
  std::vector<std::string> names;
  DIR* dp = opendir(dir.c_str());
  if (dp == nullptr) {
    return names;
  }
  while (struct dirent* entry = readdir(dp)) {
    std::string name(entry->d_name);
    if (name == "." || name == "..") continue;
    if (!IsDirectory((Path(dir) / name).get_path())) {
      names.push_back(name);
    }
  }
  closedir(dp);
  std::sort(names.begin(), names.end());
  return names;
}

LsStatus ReadProtoFromTextFile(const std::string& filename,
                               google::protobuf::Message* proto) {
  int fd = open(filename.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG(ERROR) << "File not found: " << filename;
    return LsStatus::LMSPARK_IO_ERROR;
  }
  auto* input = new google::protobuf::io::FileInputStream(fd);
  bool success = google::protobuf::TextFormat::Parse(input, proto);
  delete input;
  close(fd);
  if (!success) {
    LOG(ERROR) << "Failed to parse " << proto->GetTypeName() << " from "
               << filename;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

}  // namespace util
}  // namespace lmspark
