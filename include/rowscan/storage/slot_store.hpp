#pragma once

#include "rowscan/storage/row.hpp"
#include "rowscan/storage/storage_ids.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace rowscan::storage {

// Arena of row slots. Free slots form a singly linked list threaded through the arena,
// so a vacated slot is reused by the next insertion in O(1).
class SlotStore final {
public:
    struct Config final {
        // Multi-version stores never collapse to empty on removal of their last row.
        bool multi_version = false;
    };

    SlotStore();
    explicit SlotStore(Config config);

    SlotStore(const SlotStore&) = delete;
    SlotStore& operator=(const SlotStore&) = delete;
    SlotStore(SlotStore&&) = delete;
    SlotStore& operator=(SlotStore&&) = delete;

    Row& add(std::unique_ptr<Row> row);
    [[nodiscard]] std::error_code remove(SlotIndex slot, std::unique_ptr<Row>& out_row);

    [[nodiscard]] const Row* get(SlotIndex slot) const noexcept;
    [[nodiscard]] Row* get(SlotIndex slot) noexcept;
    [[nodiscard]] const Row* next_occupied_after(std::optional<SlotIndex> slot) const noexcept;

    // True while a row with this token sits in a slot or in the retired area.
    [[nodiscard]] bool holds(RowToken token) const noexcept;

    void truncate() noexcept;

    [[nodiscard]] std::uint64_t row_count() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t free_slot_count() const noexcept;
    [[nodiscard]] std::optional<SlotIndex> free_list_head() const noexcept;
    [[nodiscard]] std::vector<SlotIndex> free_list() const;

    // Rows removed in multi-version mode stay here until their delete commits or rolls back.
    Row& retire(std::unique_ptr<Row> row);
    [[nodiscard]] Row* find_retired(RowToken token) noexcept;
    [[nodiscard]] std::unique_ptr<Row> restore(RowToken token);
    bool release_retired(RowToken token) noexcept;
    [[nodiscard]] std::size_t retired_count() const noexcept;

    void for_each_occupied(const std::function<void(const Row&)>& visitor) const;

private:
    struct OccupiedSlot final {
        std::unique_ptr<Row> row{};
    };

    struct FreeSlot final {
        std::optional<SlotIndex> next{};
    };

    using Slot = std::variant<OccupiedSlot, FreeSlot>;

    void reset_arena() noexcept;

    Config config_{};
    std::vector<Slot> slots_{};
    std::optional<SlotIndex> first_free_{};
    std::size_t free_count_ = 0U;
    std::uint64_t row_count_ = 0U;
    RowToken next_token_ = 1U;
    std::unordered_set<RowToken> live_tokens_{};
    std::unordered_map<RowToken, std::unique_ptr<Row>> retired_{};
};

}  // namespace rowscan::storage
