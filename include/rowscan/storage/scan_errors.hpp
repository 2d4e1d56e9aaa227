#pragma once

#include <system_error>

namespace rowscan::storage {

enum class ScanErrc {
    Success = 0,
    SlotNotFound,
    SlotNotOccupied,
    UnsupportedOperation,
    CountOverflow,
    RowNotRetired,
    ConcurrentUpdate,
    InvalidArgument
};

const std::error_category& scan_error_category() noexcept;
std::error_code make_error_code(ScanErrc value) noexcept;

}  // namespace rowscan::storage

namespace std {

template <>
struct is_error_code_enum<rowscan::storage::ScanErrc> : true_type {
};

}  // namespace std
