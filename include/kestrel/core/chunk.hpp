#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace kestrel {

/// Validity bitmap: true = valid (not null), false = null.
using Validity = std::vector<bool>;

/// Backing storage of a chunk. Immutable once wrapped in a Chunk.
///
/// `validity` is nullopt when every slot is valid, the common case, with zero
/// overhead. Null slots hold a value-initialized T.
template <typename T>
struct ChunkBuffer {
    std::vector<T> values;
    std::optional<Validity> validity;
};

/// A contiguous, fixed-type window onto a shared ChunkBuffer.
///
/// Copying or slicing a Chunk never copies element data; the buffer is
/// reference-counted and never written after construction.
template <typename T>
class Chunk {
   public:
    using value_type = T;
    using size_type = std::size_t;

    Chunk() : buffer_(std::make_shared<const ChunkBuffer<T>>()) {}

    explicit Chunk(std::vector<T> values, std::optional<Validity> validity = std::nullopt) {
        if (validity.has_value() && validity->size() != values.size()) {
            throw std::invalid_argument("chunk validity length does not match value length");
        }
        length_ = values.size();
        buffer_ = std::make_shared<const ChunkBuffer<T>>(
            ChunkBuffer<T>{.values = std::move(values), .validity = std::move(validity)});
        null_count_ = count_nulls();
    }

    Chunk(std::shared_ptr<const ChunkBuffer<T>> buffer, size_type offset, size_type length)
        : buffer_(std::move(buffer)), offset_(offset), length_(length) {
        if (offset_ + length_ > buffer_->values.size()) {
            throw std::invalid_argument("chunk window exceeds its buffer");
        }
        null_count_ = count_nulls();
    }

    [[nodiscard]] auto size() const noexcept -> size_type { return length_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return length_ == 0; }
    [[nodiscard]] auto null_count() const noexcept -> size_type { return null_count_; }
    [[nodiscard]] auto has_nulls() const noexcept -> bool { return null_count_ > 0; }

    [[nodiscard]] auto is_valid(size_type idx) const noexcept -> bool {
        return null_count_ == 0 || (*buffer_->validity)[offset_ + idx];
    }

    /// Unchecked element access; the result is unspecified for null slots.
    [[nodiscard]] decltype(auto) value(size_type idx) const noexcept {
        return buffer_->values[offset_ + idx];
    }

    [[nodiscard]] auto get(size_type idx) const -> std::optional<T> {
        if (!is_valid(idx)) {
            return std::nullopt;
        }
        return value(idx);
    }

    /// Zero-copy sub-window. Bounds are clamped to this chunk.
    [[nodiscard]] auto slice(size_type offset, size_type length) const -> Chunk<T> {
        offset = std::min(offset, length_);
        length = std::min(length, length_ - offset);
        return Chunk<T>(buffer_, offset_ + offset, length);
    }

    /// Raw element pointer for dense interop. Not available for bool, whose
    /// storage is bit-packed.
    [[nodiscard]] auto data() const noexcept -> const T*
        requires(!std::is_same_v<T, bool>)
    {
        return buffer_->values.data() + offset_;
    }

    [[nodiscard]] auto buffer() const noexcept -> const std::shared_ptr<const ChunkBuffer<T>>& {
        return buffer_;
    }

    [[nodiscard]] auto offset() const noexcept -> size_type { return offset_; }

   private:
    [[nodiscard]] auto count_nulls() const -> size_type {
        if (!buffer_->validity.has_value()) {
            return 0;
        }
        const auto& bits = *buffer_->validity;
        size_type nulls = 0;
        for (size_type i = 0; i < length_; ++i) {
            if (!bits[offset_ + i]) {
                ++nulls;
            }
        }
        return nulls;
    }

    std::shared_ptr<const ChunkBuffer<T>> buffer_;
    size_type offset_ = 0;
    size_type length_ = 0;
    size_type null_count_ = 0;
};

}  // namespace kestrel
