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

#ifndef COVERTOOLS_BASE_BITMAP_H_
#define COVERTOOLS_BASE_BITMAP_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/log/check.h"
#include "absl/numeric/bits.h"
#include "absl/types/span.h"

namespace covertools {
namespace internal {
inline uint64_t OneBit64(int pos) { return uint64_t{1} << pos; }
inline uint64_t BitPos64(uint64_t pos) { return (pos & 63); }
inline uint64_t BitOffset64(uint64_t pos) { return (pos >> 6); }
inline uint64_t BitLength64(uint64_t size) { return ((size + 63) >> 6); }
}  // namespace internal

// Fixed-size packed bit array. The bits beyond size() in the last word are
// always zero, so that word-wise population counts are exact.
class Bitmap {
 public:
  Bitmap() : size_(0) {}

  // fill: true = initialize with 1's, false = initialize with 0's.
  explicit Bitmap(uint32_t size, bool fill = false)
      : size_(size), words_(internal::BitLength64(size), 0) {
    SetAll(fill);
  }

  uint32_t size() const { return size_; }

  bool Get(uint32_t index) const {
    DCHECK_LT(index, size_);
    return (words_[internal::BitOffset64(index)] &
            internal::OneBit64(internal::BitPos64(index))) != 0;
  }

  void Set(uint32_t index, bool value) {
    DCHECK_LT(index, size_);
    uint64_t& word = words_[internal::BitOffset64(index)];
    if (value) {
      word |= internal::OneBit64(internal::BitPos64(index));
    } else {
      word &= ~internal::OneBit64(internal::BitPos64(index));
    }
  }

  // Sets all the bits to true or false.
  void SetAll(bool value) {
    for (uint64_t& word : words_) word = value ? ~uint64_t{0} : uint64_t{0};
    if (value) ClearPadding();
  }

  void Clear() { SetAll(false); }

  // Number of bits set to true.
  int64_t PopCount() const {
    int64_t count = 0;
    for (const uint64_t word : words_) count += absl::popcount(word);
    return count;
  }

  // Number of positions set in this bitmap and cleared in `mask`, i.e.
  // |this \ mask|. Both bitmaps must have the same size.
  int64_t PopCountAndNot(const Bitmap& mask) const {
    DCHECK_EQ(size_, mask.size_);
    int64_t count = 0;
    for (size_t w = 0; w < words_.size(); ++w) {
      count += absl::popcount(words_[w] & ~mask.words_[w]);
    }
    return count;
  }

  absl::Span<const uint64_t> words() const { return words_; }

 private:
  void ClearPadding() {
    const uint32_t excess = words_.size() * 64 - size_;
    if (excess > 0) words_.back() &= ~uint64_t{0} >> excess;
  }

  uint32_t size_;
  std::vector<uint64_t> words_;
};

}  // namespace covertools

#endif  // COVERTOOLS_BASE_BITMAP_H_
