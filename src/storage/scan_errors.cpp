#include "rowscan/storage/scan_errors.hpp"

#include <string>

namespace rowscan::storage {

namespace {

class ScanErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowscan.scan";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ScanErrc>(condition)) {
        case ScanErrc::Success:
            return "success";
        case ScanErrc::SlotNotFound:
            return "row not found while deleting";
        case ScanErrc::SlotNotOccupied:
            return "slot is not occupied";
        case ScanErrc::UnsupportedOperation:
            return "feature not supported: SCAN";
        case ScanErrc::CountOverflow:
            return "row count overflow";
        case ScanErrc::RowNotRetired:
            return "row is not retained for rollback";
        case ScanErrc::ConcurrentUpdate:
            return "concurrent update";
        case ScanErrc::InvalidArgument:
            return "invalid argument";
        default:
            return "unknown scan error";
        }
    }
};

const ScanErrorCategory kCategory{};

}  // namespace

const std::error_category& scan_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ScanErrc value) noexcept
{
    return {static_cast<int>(value), scan_error_category()};
}

}  // namespace rowscan::storage
