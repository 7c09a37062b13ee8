#pragma once

#include "records.hpp"
#include "visibility.hpp"
#include <cassert>

namespace dbn {

namespace internal {

/**
 * @brief Prints a diagnostic describing a record whose length is too small for its discriminant
 * and aborts the process.
 */
[[noreturn]] DBN_PUBLIC void FailMalformedRecord(const RecordHeader& header, size_t expectedSize);

}  // namespace internal

/**
 * @brief A non-owning, type-tagged view over exactly one encoded record. The view never outlives
 * the bytes it points to: views produced by a StreamDecoder are valid until the next call that
 * mutates the decoder's buffer.
 */
class DBN_PUBLIC RecordRef {
public:
  /**
   * @brief Creates a view over `size` bytes starting at `data`. `data` must be 8-byte aligned and
   * hold at least a full RecordHeader.
   */
  RecordRef(const std::byte* data, size_t size)
      : data_(data) {
    assert(data != nullptr);
    assert(size >= sizeof(RecordHeader));
    assert(reinterpret_cast<uintptr_t>(data) % alignof(RecordHeader) == 0);
    (void)size;
  }

  /**
   * @brief Creates a view over a typed record. The record's header must describe its size.
   */
  template <typename T>
  static RecordRef FromRecord(const T& record) {
    return RecordRef(reinterpret_cast<const std::byte*>(&record), sizeof(T));
  }

  const RecordHeader& header() const {
    return *reinterpret_cast<const RecordHeader*>(data_);
  }

  size_t recordSize() const {
    return header().recordSize();
  }

  /**
   * @brief The encoded bytes of the record, `recordSize()` bytes long.
   */
  const std::byte* data() const {
    return data_;
  }

  Status rtype(RType* output) const {
    return header().rtypeAsEnum(output);
  }

  /**
   * @brief Returns true if the record's discriminant is one that `T` accepts.
   */
  template <typename T>
  bool has() const {
    return T::HasRType(header().rtype);
  }

  /**
   * @brief Returns a typed pointer to the record, or nullptr if the discriminant does not belong
   * to `T`. Aborts if the discriminant matches but the record is shorter than `T`.
   */
  template <typename T>
  const T* get() const {
    if (!has<T>()) {
      return nullptr;
    }
    if (recordSize() < sizeof(T)) {
      internal::FailMalformedRecord(header(), sizeof(T));
    }
    return reinterpret_cast<const T*>(data_);
  }

  /**
   * @brief Returns a typed pointer without checking the discriminant or the length. Only valid
   * after `has<T>()` returned true for a record produced by a decoder.
   */
  template <typename T>
  const T* getUnchecked() const {
    assert(has<T>());
    assert(recordSize() >= sizeof(T));
    return reinterpret_cast<const T*>(data_);
  }

  /**
   * @brief Converts the view into a typed pointer variant. Returns
   * `StatusCode::UnknownRecordType` for a discriminant outside the catalog and
   * `StatusCode::TruncatedRecord` if the record is shorter than its type.
   */
  Status asVariant(RecordRefVariant* output) const;

  /**
   * @brief Copies the record into an owned variant. Fails the same way as `asVariant()`.
   */
  Status toOwned(RecordVariant* output) const;

private:
  const std::byte* data_;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "record_ref.inl"
#endif
