#pragma once

#include "rowscan/storage/storage_ids.hpp"
#include "rowscan/txn/session_types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace rowscan::storage {

class SlotStore;

// A table row as seen by the scan storage. The payload is opaque; identity is the token
// the slot store assigns on first insertion, never the payload contents.
class Row final {
public:
    Row() = default;
    explicit Row(std::vector<std::byte> payload);

    [[nodiscard]] RowToken token() const noexcept;
    [[nodiscard]] std::optional<SlotIndex> slot() const noexcept;
    [[nodiscard]] bool deleted() const noexcept;
    [[nodiscard]] txn::SessionId owning_session() const noexcept;
    [[nodiscard]] std::span<const std::byte> payload() const noexcept;

    void set_slot(std::optional<SlotIndex> slot) noexcept;
    void set_deleted(bool deleted) noexcept;
    void set_owning_session(txn::SessionId session) noexcept;

private:
    friend class SlotStore;

    RowToken token_ = kUnassignedRowToken;
    std::optional<SlotIndex> slot_{};
    bool deleted_ = false;
    txn::SessionId owning_session_ = txn::kNoSession;
    std::vector<std::byte> payload_{};
};

}  // namespace rowscan::storage
