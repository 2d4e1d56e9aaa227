#pragma once

#include "rowscan/storage/storage_ids.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rowscan::storage {

class LargeObjectStore {
public:
    virtual ~LargeObjectStore() = default;
    virtual void remove_all_for_table(TableId table_id) = 0;
};

class ScanDatabase {
public:
    virtual ~ScanDatabase() = default;

    [[nodiscard]] virtual bool is_multi_version_mode() const noexcept = 0;
    [[nodiscard]] virtual LargeObjectStore* large_object_store() noexcept = 0;
};

class ScanTable {
public:
    virtual ~ScanTable() = default;

    [[nodiscard]] virtual TableId id() const noexcept = 0;
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual bool contains_large_object() const noexcept = 0;
    [[nodiscard]] virtual bool persists_data() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t row_count_approximation() const noexcept = 0;
    virtual void set_row_count(std::uint64_t row_count) = 0;
};

class LargeObjectStoreStub final : public LargeObjectStore {
public:
    void remove_all_for_table(TableId table_id) override
    {
        removed_tables_.push_back(table_id);
    }

    [[nodiscard]] const std::vector<TableId>& removed_tables() const noexcept
    {
        return removed_tables_;
    }

private:
    std::vector<TableId> removed_tables_{};
};

class ScanDatabaseStub final : public ScanDatabase {
public:
    explicit ScanDatabaseStub(bool multi_version = false, LargeObjectStore* large_objects = nullptr)
        : multi_version_{multi_version}
        , large_objects_{large_objects}
    {
    }

    bool is_multi_version_mode() const noexcept override
    {
        return multi_version_;
    }

    LargeObjectStore* large_object_store() noexcept override
    {
        return large_objects_;
    }

    void set_multi_version_mode(bool multi_version) noexcept
    {
        multi_version_ = multi_version;
    }

private:
    bool multi_version_ = false;
    LargeObjectStore* large_objects_ = nullptr;
};

class ScanTableStub final : public ScanTable {
public:
    struct Options final {
        TableId id{1U};
        std::string name{"TEST"};
        bool contains_large_object = false;
        bool persists_data = true;
    };

    ScanTableStub()
        : ScanTableStub(Options{})
    {
    }

    explicit ScanTableStub(Options options)
        : options_{std::move(options)}
    {
    }

    TableId id() const noexcept override
    {
        return options_.id;
    }

    const std::string& name() const noexcept override
    {
        return options_.name;
    }

    bool contains_large_object() const noexcept override
    {
        return options_.contains_large_object;
    }

    bool persists_data() const noexcept override
    {
        return options_.persists_data;
    }

    std::uint64_t row_count_approximation() const noexcept override
    {
        return row_count_;
    }

    void set_row_count(std::uint64_t row_count) override
    {
        row_count_ = row_count;
        ++row_count_notifications_;
    }

    [[nodiscard]] std::uint64_t row_count_notifications() const noexcept
    {
        return row_count_notifications_;
    }

private:
    Options options_{};
    std::uint64_t row_count_ = 0U;
    std::uint64_t row_count_notifications_ = 0U;
};

}  // namespace rowscan::storage
