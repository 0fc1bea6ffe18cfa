/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    file_util.h
 */

#pragma once

#include <common/common.h>
#include <google/protobuf/message.h>

#include <string>
#include <vector>

namespace lmspark {
namespace util {

bool IsExists(const std::string& file_path);
bool IsDirectory(const std::string& path);
bool MakeDirs(const std::string& path);
// regular file names directly under dir, sorted
std::vector<std::string> ListFiles(const std::string& dir);

// LMSPARK_IO_ERROR when the file can't be opened, LMSPARK_PARAM_ERROR when
// the text is not a valid message
LsStatus ReadProtoFromTextFile(const std::string& filename,
                               google::protobuf::Message* proto);

class Path {
 public:
  Path(const std::string& path) : m_path(path) {}

  std::string filename() const {
    size_t pos = m_path.find_last_of('/');
    if (pos != std::string::npos)
      return m_path.substr(pos + 1);
    else
      return m_path;
  }

  std::string extension() const {
    size_t dotPos = m_path.rfind('.');
    size_t slashPos = m_path.find_last_of('/');

    if (dotPos != std::string::npos &&
        (slashPos == std::string::npos || dotPos > slashPos))
      return m_path.substr(dotPos);
    else
      return "";
  }

  Path operator/(const std::string& name) const {
    if (m_path.empty() || m_path.back() == '/') return Path(m_path + name);
    return Path(m_path + "/" + name);
  }

  std::string get_path() const { return m_path; }

 private:
  std::string m_path;
};

}  // namespace util
}  // namespace lmspark
