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

// StrongInt<T> is a simple template class mechanism for defining "logical"
// integer-like class types that support almost all of the same functionality
// as native integer types, but which prevents assignment, construction, and
// other operations from other integer-like types. In the set-covering code
// this keeps subset indices and element indices from being mixed up:
//
//    DEFINE_STRONG_INT_TYPE(SubsetIndex, int32_t);
//    DEFINE_STRONG_INT_TYPE(ElementIndex, int32_t);
//    SubsetIndex subset(3);
//    ElementIndex element = subset;  // Does not compile.
//
// Arithmetic is only defined between values of the same StrongInt type, with
// the exception of multiplication and division by a native integer.
//
// A StrongInt compiles away to its native type in optimized mode, so it can be
// passed around by value.

#ifndef COVERTOOLS_BASE_STRONG_INT_H_
#define COVERTOOLS_BASE_STRONG_INT_H_

#include <cstddef>
#include <iterator>
#include <functional>
#include <limits>
#include <ostream>
#include <type_traits>
#include <utility>

#include "absl/strings/string_view.h"

namespace util_intops {

template <typename TagType, typename NativeType>
class StrongInt {
 public:
  typedef NativeType ValueType;

  static_assert(std::numeric_limits<NativeType>::is_integer,
                "StrongInt requires an integral native type");

  struct Hasher {
    size_t operator()(const StrongInt& x) const {
      return static_cast<size_t>(x.value());
    }
  };

  static constexpr absl::string_view TypeName() { return TagType::TypeName(); }

  constexpr StrongInt() : value_(NativeType()) {}

  // Explicit initialization from any arithmetic value.
  template <typename T,
            typename = std::enable_if_t<std::is_arithmetic<T>::value>>
  explicit constexpr StrongInt(T init_value)
      : value_(static_cast<NativeType>(init_value)) {}

  constexpr ValueType value() const { return value_; }

  // Same as value(), for call sites that want to be explicit about the
  // conversion target.
  template <typename ValType>
  constexpr ValType value() const {
    return static_cast<ValType>(value_);
  }

  // -- UNARY OPERATORS --------------------------------------------------------
  StrongInt& operator++() {
    ++value_;
    return *this;
  }
  const StrongInt operator++(int) {
    StrongInt temp(*this);
    ++value_;
    return temp;
  }
  StrongInt& operator--() {
    --value_;
    return *this;
  }
  const StrongInt operator--(int) {
    StrongInt temp(*this);
    --value_;
    return temp;
  }
  constexpr StrongInt operator-() const { return StrongInt(-value_); }
  constexpr StrongInt operator+() const { return *this; }

  // -- ASSIGNMENT OPERATORS ---------------------------------------------------
  StrongInt& operator+=(StrongInt arg) {
    value_ += arg.value();
    return *this;
  }
  StrongInt& operator-=(StrongInt arg) {
    value_ -= arg.value();
    return *this;
  }
  template <typename ArgType,
            typename = std::enable_if_t<std::is_arithmetic<ArgType>::value>>
  StrongInt& operator*=(ArgType arg) {
    value_ *= arg;
    return *this;
  }
  template <typename ArgType,
            typename = std::enable_if_t<std::is_arithmetic<ArgType>::value>>
  StrongInt& operator/=(ArgType arg) {
    value_ /= arg;
    return *this;
  }

 private:
  NativeType value_;
};

// -- NON-MEMBER ARITHMETIC OPERATORS -------------------------------------------
template <typename TagType, typename NativeType>
constexpr StrongInt<TagType, NativeType> operator+(
    StrongInt<TagType, NativeType> lhs, StrongInt<TagType, NativeType> rhs) {
  return StrongInt<TagType, NativeType>(lhs.value() + rhs.value());
}

template <typename TagType, typename NativeType>
constexpr StrongInt<TagType, NativeType> operator-(
    StrongInt<TagType, NativeType> lhs, StrongInt<TagType, NativeType> rhs) {
  return StrongInt<TagType, NativeType>(lhs.value() - rhs.value());
}

template <typename TagType, typename NativeType, typename NumType,
          typename = std::enable_if_t<std::is_arithmetic<NumType>::value>>
constexpr StrongInt<TagType, NativeType> operator*(
    StrongInt<TagType, NativeType> lhs, NumType rhs) {
  return StrongInt<TagType, NativeType>(lhs.value() * rhs);
}

template <typename TagType, typename NativeType, typename NumType,
          typename = std::enable_if_t<std::is_arithmetic<NumType>::value>>
constexpr StrongInt<TagType, NativeType> operator/(
    StrongInt<TagType, NativeType> lhs, NumType rhs) {
  return StrongInt<TagType, NativeType>(lhs.value() / rhs);
}

// -- COMPARISON OPERATORS ------------------------------------------------------
#define STRONG_INT_COMPARISON_OP(op)                                \
  template <typename TagType, typename NativeType>                 \
  constexpr bool operator op(StrongInt<TagType, NativeType> lhs,   \
                             StrongInt<TagType, NativeType> rhs) { \
    return lhs.value() op rhs.value();                             \
  }
STRONG_INT_COMPARISON_OP(==);  // NOLINT(whitespace/operators)
STRONG_INT_COMPARISON_OP(!=);  // NOLINT(whitespace/operators)
STRONG_INT_COMPARISON_OP(<);   // NOLINT(whitespace/operators)
STRONG_INT_COMPARISON_OP(<=);  // NOLINT(whitespace/operators)
STRONG_INT_COMPARISON_OP(>);   // NOLINT(whitespace/operators)
STRONG_INT_COMPARISON_OP(>=);  // NOLINT(whitespace/operators)
#undef STRONG_INT_COMPARISON_OP

// Allows StrongInts to be used as keys in absl hash containers.
template <typename H, typename TagType, typename NativeType>
H AbslHashValue(H h, const StrongInt<TagType, NativeType>& i) {
  return H::combine(std::move(h), i.value());
}

template <typename TagType, typename NativeType>
std::ostream& operator<<(std::ostream& os,
                         StrongInt<TagType, NativeType> arg) {
  return os << arg.value();
}

// Range of StrongInt values, usable in range-based for loops:
//   for (const SubsetIndex subset : StrongIntRange<SubsetIndex>(n)) ...
template <typename IntType>
class StrongIntRange {
 public:
  class StrongIntRangeIterator {
   public:
    using value_type = IntType;
    using difference_type = IntType;
    using reference = const IntType&;
    using pointer = const IntType*;
    using iterator_category = std::input_iterator_tag;

    explicit StrongIntRangeIterator(IntType initial) : current_(initial) {}
    bool operator!=(const StrongIntRangeIterator& other) const {
      return current_ != other.current_;
    }
    bool operator==(const StrongIntRangeIterator& other) const {
      return current_ == other.current_;
    }
    value_type operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    StrongIntRangeIterator& operator++() {
      ++current_;
      return *this;
    }

   private:
    IntType current_;
  };

  // Loops from IntType(0) up to (but not including) end.
  explicit StrongIntRange(IntType end) : begin_(IntType(0)), end_(end) {}
  // Loops from begin up to (but not including) end.
  StrongIntRange(IntType begin, IntType end) : begin_(begin), end_(end) {}
  StrongIntRangeIterator begin() const { return begin_; }
  StrongIntRangeIterator end() const { return end_; }

 private:
  const StrongIntRangeIterator begin_;
  const StrongIntRangeIterator end_;
};

}  // namespace util_intops

// Defines the StrongInt using value_type and typedefs it to type_name, with no
// validation of under/overflow situations.
#define DEFINE_STRONG_INT_TYPE(type_name, value_type)               \
  struct type_name##_strong_int_tag_ {                              \
    static constexpr absl::string_view TypeName() { return #type_name; } \
  };                                                                \
  typedef ::util_intops::StrongInt<type_name##_strong_int_tag_, value_type> \
      type_name;

namespace std {
template <typename TagType, typename NativeType>
struct hash<util_intops::StrongInt<TagType, NativeType>>
    : util_intops::StrongInt<TagType, NativeType>::Hasher {};
}  // namespace std

#endif  // COVERTOOLS_BASE_STRONG_INT_H_
