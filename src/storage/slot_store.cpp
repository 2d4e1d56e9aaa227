#include "rowscan/storage/slot_store.hpp"

#include "rowscan/storage/scan_errors.hpp"

#include <stdexcept>
#include <utility>

namespace rowscan::storage {

SlotStore::SlotStore()
    : SlotStore(Config{})
{
}

SlotStore::SlotStore(Config config)
    : config_{config}
{
}

Row& SlotStore::add(std::unique_ptr<Row> row)
{
    if (!row) {
        throw std::invalid_argument{"SlotStore::add requires a row"};
    }

    if (row->token_ == kUnassignedRowToken) {
        row->token_ = next_token_++;
    } else if (holds(row->token_)) {
        throw std::invalid_argument{"SlotStore::add row token is already stored"};
    } else if (row->token_ >= next_token_) {
        next_token_ = row->token_ + 1U;
    }
    row->deleted_ = false;
    const auto row_token = row->token_;

    SlotIndex slot{};
    if (!first_free_) {
        slot = SlotIndex{static_cast<std::uint64_t>(slots_.size())};
        row->slot_ = slot;
        slots_.emplace_back(OccupiedSlot{std::move(row)});
    } else {
        slot = *first_free_;
        auto& entry = slots_[static_cast<std::size_t>(slot.value)];
        first_free_ = std::get<FreeSlot>(entry).next;
        --free_count_;
        row->slot_ = slot;
        entry = OccupiedSlot{std::move(row)};
    }

    live_tokens_.insert(row_token);
    ++row_count_;
    return *std::get<OccupiedSlot>(slots_[static_cast<std::size_t>(slot.value)]).row;
}

std::error_code SlotStore::remove(SlotIndex slot, std::unique_ptr<Row>& out_row)
{
    if (slot.value >= slots_.size()) {
        return make_error_code(ScanErrc::SlotNotFound);
    }

    auto& entry = slots_[static_cast<std::size_t>(slot.value)];
    auto* occupied = std::get_if<OccupiedSlot>(&entry);
    if (occupied == nullptr) {
        return make_error_code(ScanErrc::SlotNotOccupied);
    }

    out_row = std::move(occupied->row);
    out_row->slot_.reset();
    live_tokens_.erase(out_row->token_);

    if (!config_.multi_version && row_count_ == 1U) {
        reset_arena();
    } else {
        entry = FreeSlot{first_free_};
        first_free_ = slot;
        ++free_count_;
    }

    --row_count_;
    return {};
}

const Row* SlotStore::get(SlotIndex slot) const noexcept
{
    if (slot.value >= slots_.size()) {
        return nullptr;
    }
    const auto* occupied = std::get_if<OccupiedSlot>(&slots_[static_cast<std::size_t>(slot.value)]);
    return occupied != nullptr ? occupied->row.get() : nullptr;
}

Row* SlotStore::get(SlotIndex slot) noexcept
{
    return const_cast<Row*>(static_cast<const SlotStore&>(*this).get(slot));
}

const Row* SlotStore::next_occupied_after(std::optional<SlotIndex> slot) const noexcept
{
    std::size_t index = slot ? static_cast<std::size_t>(slot->value) + 1U : 0U;
    for (; index < slots_.size(); ++index) {
        const auto* occupied = std::get_if<OccupiedSlot>(&slots_[index]);
        if (occupied != nullptr && !occupied->row->deleted_) {
            return occupied->row.get();
        }
    }
    return nullptr;
}

bool SlotStore::holds(RowToken token) const noexcept
{
    return live_tokens_.contains(token) || retired_.contains(token);
}

void SlotStore::truncate() noexcept
{
    reset_arena();
    live_tokens_.clear();
    retired_.clear();
    row_count_ = 0U;
}

std::uint64_t SlotStore::row_count() const noexcept
{
    return row_count_;
}

std::size_t SlotStore::size() const noexcept
{
    return slots_.size();
}

std::size_t SlotStore::free_slot_count() const noexcept
{
    return free_count_;
}

std::optional<SlotIndex> SlotStore::free_list_head() const noexcept
{
    return first_free_;
}

std::vector<SlotIndex> SlotStore::free_list() const
{
    std::vector<SlotIndex> chain;
    chain.reserve(free_count_);

    // A well formed list never holds more entries than the arena has slots.
    auto cursor = first_free_;
    while (cursor && chain.size() <= slots_.size()) {
        chain.push_back(*cursor);
        if (cursor->value >= slots_.size()) {
            break;
        }
        const auto* free_slot = std::get_if<FreeSlot>(&slots_[static_cast<std::size_t>(cursor->value)]);
        if (free_slot == nullptr) {
            break;
        }
        cursor = free_slot->next;
    }
    return chain;
}

Row& SlotStore::retire(std::unique_ptr<Row> row)
{
    if (!row) {
        throw std::invalid_argument{"SlotStore::retire requires a row"};
    }
    const auto token = row->token_;
    auto& slot = retired_[token];
    slot = std::move(row);
    return *slot;
}

Row* SlotStore::find_retired(RowToken token) noexcept
{
    auto iter = retired_.find(token);
    return iter != retired_.end() ? iter->second.get() : nullptr;
}

std::unique_ptr<Row> SlotStore::restore(RowToken token)
{
    auto iter = retired_.find(token);
    if (iter == retired_.end()) {
        return nullptr;
    }
    auto row = std::move(iter->second);
    retired_.erase(iter);
    return row;
}

bool SlotStore::release_retired(RowToken token) noexcept
{
    return retired_.erase(token) != 0U;
}

std::size_t SlotStore::retired_count() const noexcept
{
    return retired_.size();
}

void SlotStore::for_each_occupied(const std::function<void(const Row&)>& visitor) const
{
    if (!visitor) {
        return;
    }
    for (const auto& entry : slots_) {
        if (const auto* occupied = std::get_if<OccupiedSlot>(&entry); occupied != nullptr) {
            visitor(*occupied->row);
        }
    }
}

void SlotStore::reset_arena() noexcept
{
    slots_.clear();
    first_free_.reset();
    free_count_ = 0U;
}

}  // namespace rowscan::storage
