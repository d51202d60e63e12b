#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace wsarrow {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T>;

/// A typed, owning, append-only columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values. Null
/// tracking lives beside it (see native::ColumnEntry), so a null slot holds a
/// value-initialized placeholder.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using const_reference = typename std::vector<T>::const_reference;

    static_assert(ColumnElement<T>, "Column<T> requires T to satisfy ColumnElement (regular).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> const_reference { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    /// Zero-copy immutable view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T>
        requires(!std::same_as<T, bool>)
    {
        return data_;
    }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Append a value-initialized placeholder (used for null slots).
    void push_default() { data_.emplace_back(); }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    void clear() noexcept { data_.clear(); }

    [[nodiscard]] auto back() const -> const_reference { return data_.back(); }

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace wsarrow
