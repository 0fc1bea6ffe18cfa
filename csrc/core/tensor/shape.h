/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    shape.h
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace lmspark {

using dim_t = int64_t;

class Shape {
 public:
  Shape() = default;
  Shape(const std::vector<dim_t>& shape);
  Shape(const std::initializer_list<dim_t>& shape);
  Shape(const int ndim, const dim_t* val);

  int Size() const;
  // product of dims in [start, ndim); 0 for a rank-0 shape
  int64_t Count(int start = 0) const;
  int64_t Count(int start, int end) const;
  void Append(dim_t axis);
  std::string ToString() const;
  const std::vector<dim_t>& ToVector() const { return dim; }

  dim_t* DataPtr();
  const dim_t* DataPtr() const;
  dim_t& operator[](int index);
  dim_t operator[](int index) const;
  bool operator==(const Shape& shape) const;
  bool operator!=(const Shape& shape) const;

 private:
  std::vector<dim_t> dim;
};

inline std::ostream& operator<<(std::ostream& out, const Shape& shape) {
  return out << shape.ToString();
}

}  // namespace lmspark
