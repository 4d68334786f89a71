// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// This file provides the StrongVector container that wraps around the STL
// vector. The wrapper restricts indexing to a pre-specified type-safe integer
// type or StrongInt (see covertools/base/strong_int.h). It prevents accidental
// indexing by different "logical" integer-like types (e.g. another StrongInt)
// or native integer types.
//
// Example:
//   DEFINE_STRONG_INT_TYPE(SubsetIndex, int32_t);
//   StrongVector<SubsetIndex, double> costs(SubsetIndex(10), 1.0);
//   costs[SubsetIndex(3)] = 2.0;
//   costs[3] = 2.0;  // Does not compile.

#ifndef COVERTOOLS_BASE_STRONG_VECTOR_H_
#define COVERTOOLS_BASE_STRONG_VECTOR_H_

#include <cstddef>
#include <initializer_list>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "covertools/base/strong_int.h"

namespace util_intops {

template <typename IntType, typename NativeType,
          typename Alloc = std::allocator<NativeType>>
class StrongVector : protected std::vector<NativeType, Alloc> {
 public:
  typedef std::vector<NativeType, Alloc> ParentType;
  typedef typename ParentType::size_type size_type;
  typedef typename ParentType::allocator_type allocator_type;
  typedef typename ParentType::value_type value_type;
  typedef typename ParentType::reference reference;
  typedef typename ParentType::const_reference const_reference;
  typedef typename ParentType::iterator iterator;
  typedef typename ParentType::const_iterator const_iterator;

  StrongVector() {}
  explicit StrongVector(size_type n) : ParentType(n) { DCHECK(IsValidSize()); }
  explicit StrongVector(IntType n)
      : StrongVector(static_cast<size_type>(n.value())) {}
  StrongVector(size_type n, const value_type& v) : ParentType(n, v) {
    DCHECK(IsValidSize());
  }
  StrongVector(IntType n, const value_type& v)
      : StrongVector(static_cast<size_type>(n.value()), v) {}
  StrongVector(std::initializer_list<value_type> l) : ParentType(l) {
    DCHECK(IsValidSize());
  }
  template <typename InputIteratorType,
            typename = std::enable_if_t<
                !std::is_integral<InputIteratorType>::value>>
  StrongVector(InputIteratorType first, InputIteratorType last)
      : ParentType(first, last) {
    DCHECK(IsValidSize());
  }

  // This const accessor is useful in defining the comparison operators below,
  // and when handing the data to functions taking a std::vector or a Span.
  const ParentType& get() const { return *this; }

  reference operator[](IntType i) {
    return ParentType::operator[](static_cast<size_type>(i.value()));
  }
  const_reference operator[](IntType i) const {
    return ParentType::operator[](static_cast<size_type>(i.value()));
  }

  // Typical loop will be:
  // for (auto i = v.start_index(); i < v.end_index(); ++i) ...
  IntType start_index() const { return IntType(0); }
  IntType end_index() const {
    DCHECK(IsValidSize());
    return IntType(size());
  }

  // Returns true if the vector is fully addressable by the index type.
  bool IsValidSize() const {
    return size() <= static_cast<size_type>(
                         std::numeric_limits<typename IntType::ValueType>::max());
  }

  using ParentType::back;
  using ParentType::begin;
  using ParentType::capacity;
  using ParentType::cbegin;
  using ParentType::cend;
  using ParentType::clear;
  using ParentType::empty;
  using ParentType::end;
  using ParentType::erase;
  using ParentType::front;
  using ParentType::pop_back;
  using ParentType::shrink_to_fit;

  size_type size() const { return ParentType::size(); }
  void reserve(size_type n) { ParentType::reserve(n); }
  void reserve(IntType n) { reserve(static_cast<size_type>(n.value())); }
  void resize(size_type new_size) { ParentType::resize(new_size); }
  void resize(IntType new_size) {
    resize(static_cast<size_type>(new_size.value()));
  }
  void resize(size_type new_size, const value_type& x) {
    ParentType::resize(new_size, x);
  }
  void resize(IntType new_size, const value_type& x) {
    resize(static_cast<size_type>(new_size.value()), x);
  }
  void assign(size_type n, const value_type& val) { ParentType::assign(n, val); }
  void assign(IntType n, const value_type& val) {
    assign(static_cast<size_type>(n.value()), val);
  }
  template <typename InputIt,
            typename = std::enable_if_t<!std::is_integral<InputIt>::value>>
  void assign(InputIt f, InputIt l) {
    ParentType::assign(f, l);
  }

  void push_back(const value_type& x) { ParentType::push_back(x); }
  void push_back(value_type&& x) { ParentType::push_back(std::move(x)); }
  template <typename... Args>
  void emplace_back(Args&&... args) {
    ParentType::emplace_back(std::forward<Args>(args)...);
  }

  void swap(StrongVector& x) { ParentType::swap(*x.mutable_get()); }

  friend bool operator==(const StrongVector& x, const StrongVector& y) {
    return x.get() == y.get();
  }
  friend bool operator!=(const StrongVector& x, const StrongVector& y) {
    return x.get() != y.get();
  }

 private:
  ParentType* mutable_get() { return this; }
};

}  // namespace util_intops

#endif  // COVERTOOLS_BASE_STRONG_VECTOR_H_
