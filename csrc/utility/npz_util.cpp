/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    npz_util.cpp
 */

#include "npz_util.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>
#include <vector>

#include "string_util.h"

namespace lmspark {
namespace util {

namespace {

const char kNpyMagic[] = "\x93NUMPY";
const uint32_t kLocalHeaderSig = 0x04034b50;
const uint32_t kCentralHeaderSig = 0x02014b50;
const uint32_t kEndOfCentralSig = 0x06054b50;

[[noreturn]] void ThrowIO(const std::string& msg) {
  LOG(ERROR) << msg;
  throw LsModelIOException("LMSPARK_IO_ERROR: " + msg);
}

void read_exact(FILE* fp, void* dst, size_t len, const char* what) {
  if (fread(dst, 1, len, fp) != len) {
    ThrowIO(std::string("npz_util: failed fread of ") + what);
  }
}

// value of a quoted or bare key in the header dict, e.g. 'descr': '<f4'
std::string header_value(const std::string& header, const std::string& key) {
  size_t loc = header.find("'" + key + "'");
  if (loc == std::string::npos) {
    ThrowIO("npy header has no '" + key + "' keyword: " + header);
  }
  loc = header.find(':', loc);
  if (loc == std::string::npos) {
    ThrowIO("npy header malformed: " + header);
  }
  loc = header.find_first_not_of(' ', loc + 1);
  if (header[loc] == '\'') {
    size_t end = header.find('\'', loc + 1);
    return header.substr(loc + 1, end - loc - 1);
  }
  if (header[loc] == '(') {
    size_t end = header.find(')', loc);
    if (end == std::string::npos) {
      ThrowIO("npy header malformed shape: " + header);
    }
    return header.substr(loc + 1, end - loc - 1);
  }
  size_t end = header.find_first_of(",}", loc);
  return header.substr(loc, end - loc);
}

DataType descr_to_dtype(const std::string& descr) {
  static const std::map<std::string, DataType> descr_map = {
      {"f4", DataType::FLOAT32}, {"f2", DataType::FLOAT16},
      {"i8", DataType::INT64},   {"i4", DataType::INT32},
      {"i2", DataType::INT16},   {"i1", DataType::INT8},
      {"u1", DataType::UINT8},   {"b1", DataType::BOOL},
  };
  if (descr.size() != 3 || (descr[0] != '<' && descr[0] != '|')) {
    ThrowIO("unsupported numpy descr '" + descr + "', need little endian");
  }
  auto it = descr_map.find(descr.substr(1));
  if (it == descr_map.end()) {
    ThrowIO("unsupported numpy dtype '" + descr + "'");
  }
  return it->second;
}

std::string dtype_to_descr(DataType dtype) {
  switch (dtype) {
    case DataType::FLOAT32:
      return "<f4";
    case DataType::FLOAT16:
      return "<f2";
    case DataType::INT64:
      return "<i8";
    case DataType::INT32:
      return "<i4";
    case DataType::INT16:
      return "<i2";
    case DataType::INT8:
      return "|i1";
    case DataType::UINT8:
      return "|u1";
    case DataType::BOOL:
      return "|b1";
    default:
      ThrowIO("npy_save: unsupported data type " + DataTypeToString(dtype));
  }
}

void parse_npy_header(FILE* fp, DataType& dtype, Shape& shape) {
  char preamble[8];
  read_exact(fp, preamble, 8, "npy magic");
  if (memcmp(preamble, kNpyMagic, 6) != 0) {
    ThrowIO("npy stream does not start with the numpy magic string");
  }
  uint8_t major = static_cast<uint8_t>(preamble[6]);
  uint32_t header_len = 0;
  if (major == 1) {
    uint16_t len16;
    read_exact(fp, &len16, 2, "npy header length");
    header_len = len16;
  } else if (major == 2 || major == 3) {
    read_exact(fp, &header_len, 4, "npy header length");
  } else {
    ThrowIO("unsupported npy format version " + std::to_string(major));
  }
  std::string header(header_len, ' ');
  read_exact(fp, &header[0], header_len, "npy header");

  if (header_value(header, "fortran_order") != "False") {
    ThrowIO("fortran ordered npy arrays are not supported");
  }
  dtype = descr_to_dtype(header_value(header, "descr"));
  for (auto& dim : StringUtil::Split(header_value(header, "shape"), ",")) {
    std::string s = dim;
    StringUtil::Trim(s);
    if (s.empty()) continue;
    int64_t value = 0;
    if (!StringUtil::StrToInt64(s.c_str(), value) || value < 0) {
      ThrowIO("invalid npy dimension '" + s + "'");
    }
    shape.Append(value);
  }
}

std::unique_ptr<LsTensor> load_the_npy_file(FILE* fp, const std::string& name,
                                            DeviceType device_type) {
  Shape shape;
  DataType dtype = DataType::DATATYPE_UNDEFINED;
  parse_npy_header(fp, dtype, shape);
  // rank 0 arrays hold one element
  int64_t count = shape.Size() == 0 ? 1 : shape.Count();
  std::unique_ptr<LsTensor> tensor = std::make_unique<LsTensor>(
      name, device_type, dtype, DataMode::DENSE,
      shape.Size() == 0 ? Shape({1}) : shape);
  size_t len = count * SizeofType(dtype);
  std::vector<char> buffer(len);
  read_exact(fp, buffer.data(), len, name.c_str());
  tensor->CopyDataFrom(buffer.data(), len, DeviceType::CPU);
  return tensor;
}

// skip forward to the next zip record signature
void skip_data_descriptor(FILE* fp) {
  uint32_t window = 0;
  int c;
  while ((c = fgetc(fp)) != EOF) {
    window = (window >> 8) | (static_cast<uint32_t>(c) << 24);
    if (window == kLocalHeaderSig || window == kCentralHeaderSig ||
        window == kEndOfCentralSig) {
      fseek(fp, -4, SEEK_CUR);
      return;
    }
  }
}

void load_npz_data(FILE* fp, TensorMap& data, DeviceType device_type) {
  while (1) {
    uint8_t local_header[30];
    size_t headerres = fread(local_header, 1, 30, fp);
    if (headerres < 4) break;
    uint32_t sig;
    memcpy(&sig, local_header, 4);
    // central directory reached
    if (sig != kLocalHeaderSig) break;
    if (headerres != 30) ThrowIO("npz_load: truncated local header");

    uint16_t flags, method, name_len, extra_field_len;
    memcpy(&flags, local_header + 6, 2);
    memcpy(&method, local_header + 8, 2);
    memcpy(&name_len, local_header + 26, 2);
    memcpy(&extra_field_len, local_header + 28, 2);

    std::string varname(name_len, ' ');
    read_exact(fp, &varname[0], name_len, "npz member name");
    if (method != 0) {
      ThrowIO("npz member " + varname +
              " is compressed, only np.savez archives are supported");
    }
    if (StringUtil::EndsWith(varname, ".npy")) {
      varname.erase(varname.end() - 4, varname.end());
    }
    if (extra_field_len > 0) {
      std::vector<char> buff(extra_field_len);
      read_exact(fp, buff.data(), extra_field_len, "npz extra field");
    }
    data[varname] = load_the_npy_file(fp, varname, device_type);
    if (flags & 0x8) {
      skip_data_descriptor(fp);
    }
  }
}

uint32_t crc32(const char* buf, size_t len) {
  static uint32_t table[256];
  static bool init = [] {
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int k = 0; k < 8; k++) {
        c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      }
      table[i] = c;
    }
    return true;
  }();
  (void)init;
  uint32_t crc = 0xFFFFFFFFu;
  for (size_t i = 0; i < len; i++) {
    crc = table[(crc ^ static_cast<uint8_t>(buf[i])) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

std::string npy_bytes(const LsTensor& tensor) {
  std::string header = "{'descr': '" + dtype_to_descr(tensor.GetDataType()) +
                       "', 'fortran_order': False, 'shape': (";
  const Shape& shape = tensor.GetShape();
  for (int i = 0; i < shape.Size(); i++) {
    header += std::to_string(shape[i]);
    if (shape.Size() == 1 || i + 1 < shape.Size()) header += ",";
    if (i + 1 < shape.Size()) header += " ";
  }
  header += "), }";
  // magic, version, length and header end on a 64 byte boundary
  size_t total = 10 + header.size() + 1;
  header.append((64 - total % 64) % 64, ' ');
  header += '\n';

  std::string out(kNpyMagic, 6);
  out += '\x01';
  out += '\x00';
  uint16_t len16 = static_cast<uint16_t>(header.size());
  out.append(reinterpret_cast<const char*>(&len16), 2);
  out += header;
  size_t nbytes = shape.Count() * SizeofType(tensor.GetDataType());
  std::string payload(nbytes, '\0');
  tensor.CopyDataTo(&payload[0], nbytes, DeviceType::CPU);
  out += payload;
  return out;
}

template <typename T>
void put(std::string& out, T value) {
  out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

}  // namespace

std::unique_ptr<LsTensor> npy_load(const std::string& file_path,
                                   const std::string& name,
                                   DeviceType device_type) {
  FILE* fp = fopen(file_path.c_str(), "rb");
  if (!fp) {
    ThrowIO("npy_load: unable to open " + file_path);
  }
  try {
    auto tensor = load_the_npy_file(fp, name, device_type);
    fclose(fp);
    return tensor;
  } catch (LsException& e) {
    fclose(fp);
    throw;
  }
}

void npz_load(const std::string& file_path, TensorMap& data,
              DeviceType device_type) {
  FILE* fp = fopen(file_path.c_str(), "rb");
  if (!fp) {
    ThrowIO("npz_load: unable to open " + file_path);
  }
  try {
    load_npz_data(fp, data, device_type);
    fclose(fp);
  } catch (LsException& e) {
    fclose(fp);
    throw;
  }
}

void npz_loads(const std::string& bin_data, TensorMap& data,
               DeviceType device_type) {
  FILE* fp = fmemopen((void*)bin_data.c_str(), bin_data.size(), "rb");
  if (!fp) {
    ThrowIO("Unable to read npz memory file!");
  }
  try {
    load_npz_data(fp, data, device_type);
    fclose(fp);
  } catch (LsException& e) {
    fclose(fp);
    throw;
  }
}

void npy_save(const std::string& file_path, const LsTensor& tensor) {
  std::string bytes = npy_bytes(tensor);
  FILE* fp = fopen(file_path.c_str(), "wb");
  if (!fp) {
    ThrowIO("npy_save: unable to open " + file_path);
  }
  size_t nwrite = fwrite(bytes.data(), 1, bytes.size(), fp);
  fclose(fp);
  if (nwrite != bytes.size()) {
    ThrowIO("npy_save: short write to " + file_path);
  }
}

void npz_save(const std::string& file_path, const TensorMap& data) {
  // sorted for a reproducible archive
  std::vector<std::string> names;
  for (auto& kv : data) names.push_back(kv.first);
  std::sort(names.begin(), names.end());

  std::string archive;
  std::string central;
  for (auto& name : names) {
    std::string member = name + ".npy";
    std::string body = npy_bytes(*data.at(name));
    uint32_t crc = crc32(body.data(), body.size());
    uint32_t offset = static_cast<uint32_t>(archive.size());

    put<uint32_t>(archive, kLocalHeaderSig);
    put<uint16_t>(archive, 20);  // version needed
    put<uint16_t>(archive, 0);   // flags
    put<uint16_t>(archive, 0);   // stored
    put<uint16_t>(archive, 0);   // mod time
    put<uint16_t>(archive, 0x21);  // mod date, 1980-01-01
    put<uint32_t>(archive, crc);
    put<uint32_t>(archive, static_cast<uint32_t>(body.size()));
    put<uint32_t>(archive, static_cast<uint32_t>(body.size()));
    put<uint16_t>(archive, static_cast<uint16_t>(member.size()));
    put<uint16_t>(archive, 0);
    archive += member;
    archive += body;

    put<uint32_t>(central, kCentralHeaderSig);
    put<uint16_t>(central, 20);  // version made by
    put<uint16_t>(central, 20);
    put<uint16_t>(central, 0);
    put<uint16_t>(central, 0);
    put<uint16_t>(central, 0);
    put<uint16_t>(central, 0x21);
    put<uint32_t>(central, crc);
    put<uint32_t>(central, static_cast<uint32_t>(body.size()));
    put<uint32_t>(central, static_cast<uint32_t>(body.size()));
    put<uint16_t>(central, static_cast<uint16_t>(member.size()));
    put<uint16_t>(central, 0);  // extra
    put<uint16_t>(central, 0);  // comment
    put<uint16_t>(central, 0);  // disk
    put<uint16_t>(central, 0);  // internal attr
    put<uint32_t>(central, 0);  // external attr
    put<uint32_t>(central, offset);
    central += member;
  }
  uint32_t central_offset = static_cast<uint32_t>(archive.size());
  archive += central;
  put<uint32_t>(archive, kEndOfCentralSig);
  put<uint16_t>(archive, 0);
  put<uint16_t>(archive, 0);
  put<uint16_t>(archive, static_cast<uint16_t>(names.size()));
  put<uint16_t>(archive, static_cast<uint16_t>(names.size()));
  put<uint32_t>(archive, static_cast<uint32_t>(central.size()));
  put<uint32_t>(archive, central_offset);
  put<uint16_t>(archive, 0);

  FILE* fp = fopen(file_path.c_str(), "wb");
  if (!fp) {
    ThrowIO("npz_save: unable to open " + file_path);
  }
  size_t nwrite = fwrite(archive.data(), 1, archive.size(), fp);
  fclose(fp);
  if (nwrite != archive.size()) {
    ThrowIO("npz_save: short write to " + file_path);
  }
}

}  // namespace util
}  // namespace lmspark
