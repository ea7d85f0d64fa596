#pragma once

#include <kestrel/core/chunk.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace kestrel {

/// An ordered sequence of same-typed chunks forming one logical array.
///
/// Appending shares the other array's chunk buffers. `rechunk` is the only
/// operation that copies element data to consolidate storage.
template <typename T>
class ChunkedArray {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using chunk_type = Chunk<T>;

    ChunkedArray() : chunks_{Chunk<T>{}} {}

    explicit ChunkedArray(std::vector<T> values, std::optional<Validity> validity = std::nullopt)
        : chunks_{Chunk<T>{std::move(values), std::move(validity)}} {}

    explicit ChunkedArray(Chunk<T> chunk) : chunks_{std::move(chunk)} {}

    explicit ChunkedArray(std::vector<Chunk<T>> chunks) : chunks_(std::move(chunks)) {
        if (chunks_.empty()) {
            chunks_.emplace_back();
        }
    }

    [[nodiscard]] auto size() const noexcept -> size_type {
        size_type total = 0;
        for (const auto& chunk : chunks_) {
            total += chunk.size();
        }
        return total;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] auto n_chunks() const noexcept -> size_type { return chunks_.size(); }

    [[nodiscard]] auto chunks() const noexcept -> const std::vector<Chunk<T>>& { return chunks_; }

    [[nodiscard]] auto null_count() const noexcept -> size_type {
        size_type nulls = 0;
        for (const auto& chunk : chunks_) {
            nulls += chunk.null_count();
        }
        return nulls;
    }

    [[nodiscard]] auto has_nulls() const noexcept -> bool { return null_count() > 0; }

    /// Resolve a logical position to (chunk index, position inside chunk).
    /// `idx` must be < size().
    [[nodiscard]] auto locate(size_type idx) const noexcept -> std::pair<size_type, size_type> {
        size_type c = 0;
        while (c + 1 < chunks_.size() && idx >= chunks_[c].size()) {
            idx -= chunks_[c].size();
            ++c;
        }
        return {c, idx};
    }

    [[nodiscard]] auto is_valid(size_type idx) const noexcept -> bool {
        auto [c, i] = locate(idx);
        return chunks_[c].is_valid(i);
    }

    /// Unchecked logical element access; nullopt for null slots.
    [[nodiscard]] auto get(size_type idx) const -> std::optional<T> {
        auto [c, i] = locate(idx);
        return chunks_[c].get(i);
    }

    /// Call f(value, valid) for every element in logical order.
    template <typename F>
    void for_each(F&& f) const {
        for (const auto& chunk : chunks_) {
            for (size_type i = 0; i < chunk.size(); ++i) {
                f(chunk.value(i), chunk.is_valid(i));
            }
        }
    }

    /// Append `other`'s chunks, sharing their buffers. A lone empty chunk on
    /// either side is dropped so that appending to an empty array stays at one chunk.
    void append(const ChunkedArray& other) {
        if (other.empty()) {
            return;
        }
        if (empty()) {
            chunks_ = other.chunks_;
            return;
        }
        auto incoming = other.chunks_;  // `other` may be *this
        chunks_.insert(chunks_.end(), incoming.begin(), incoming.end());
    }

    /// Consolidate all chunks into a single freshly allocated chunk.
    [[nodiscard]] auto rechunk() const -> ChunkedArray {
        if (chunks_.size() == 1) {
            return *this;
        }
        std::vector<T> values;
        values.reserve(size());
        std::optional<Validity> validity;
        if (has_nulls()) {
            validity.emplace();
            validity->reserve(size());
        }
        for_each([&](const auto& v, bool valid) {
            values.push_back(v);
            if (validity.has_value()) {
                validity->push_back(valid);
            }
        });
        return ChunkedArray(std::move(values), std::move(validity));
    }

    /// Zero-copy logical window. Caller guarantees offset + length <= size().
    [[nodiscard]] auto slice(size_type offset, size_type length) const -> ChunkedArray {
        std::vector<Chunk<T>> out;
        for (const auto& chunk : chunks_) {
            if (length == 0) {
                break;
            }
            if (offset >= chunk.size()) {
                offset -= chunk.size();
                continue;
            }
            auto take = std::min(length, chunk.size() - offset);
            out.push_back(chunk.slice(offset, take));
            length -= take;
            offset = 0;
        }
        return ChunkedArray(std::move(out));
    }

   private:
    std::vector<Chunk<T>> chunks_;
};

/// Accumulates values and nulls into a single-chunk ChunkedArray.
///
/// The validity bitmap is only materialized once the first null arrives.
template <typename T>
class ArrayBuilder {
   public:
    using size_type = std::size_t;

    ArrayBuilder() = default;
    explicit ArrayBuilder(size_type capacity) { values_.reserve(capacity); }

    void push(T value) {
        values_.push_back(std::move(value));
        if (validity_.has_value()) {
            validity_->push_back(true);
        }
    }

    void push_null() {
        if (!validity_.has_value()) {
            validity_.emplace(values_.size(), true);
        }
        values_.push_back(T{});
        validity_->push_back(false);
    }

    void push(std::optional<T> value) {
        if (value.has_value()) {
            push(std::move(*value));
        } else {
            push_null();
        }
    }

    [[nodiscard]] auto size() const noexcept -> size_type { return values_.size(); }

    [[nodiscard]] auto finish() -> ChunkedArray<T> {
        auto out = ChunkedArray<T>(std::move(values_), std::move(validity_));
        values_.clear();
        validity_.reset();
        return out;
    }

   private:
    std::vector<T> values_;
    std::optional<Validity> validity_;
};

}  // namespace kestrel
