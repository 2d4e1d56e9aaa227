#pragma once

#include <cstdint>

namespace rowscan::storage {

using RowToken = std::uint64_t;

inline constexpr RowToken kUnassignedRowToken = 0U;

struct SlotIndex final {
    std::uint64_t value = 0U;
};

struct TableId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct IndexId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

constexpr bool operator==(SlotIndex lhs, SlotIndex rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(SlotIndex lhs, SlotIndex rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(SlotIndex lhs, SlotIndex rhs) noexcept { return lhs.value < rhs.value; }
constexpr bool operator==(TableId lhs, TableId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(TableId lhs, TableId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(IndexId lhs, IndexId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(IndexId lhs, IndexId rhs) noexcept { return !(lhs == rhs); }

}  // namespace rowscan::storage
