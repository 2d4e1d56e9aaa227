#include "rowscan/storage/row.hpp"

#include <utility>

namespace rowscan::storage {

Row::Row(std::vector<std::byte> payload)
    : payload_{std::move(payload)}
{
}

RowToken Row::token() const noexcept
{
    return token_;
}

std::optional<SlotIndex> Row::slot() const noexcept
{
    return slot_;
}

bool Row::deleted() const noexcept
{
    return deleted_;
}

txn::SessionId Row::owning_session() const noexcept
{
    return owning_session_;
}

std::span<const std::byte> Row::payload() const noexcept
{
    return std::span<const std::byte>(payload_.data(), payload_.size());
}

void Row::set_slot(std::optional<SlotIndex> slot) noexcept
{
    slot_ = slot;
}

void Row::set_deleted(bool deleted) noexcept
{
    deleted_ = deleted;
}

void Row::set_owning_session(txn::SessionId session) noexcept
{
    owning_session_ = session;
}

}  // namespace rowscan::storage
