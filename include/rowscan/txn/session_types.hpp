#pragma once

#include <cstdint>

namespace rowscan::txn {

using SessionId = std::uint64_t;

// Owner of committed rows.
inline constexpr SessionId kNoSession = 0U;

enum class UndoOperation : std::uint8_t {
    Insert,
    Delete
};

class SessionIdAllocator {
public:
    virtual ~SessionIdAllocator() = default;
    virtual SessionId allocate() = 0;
    virtual SessionId peek_next() const noexcept = 0;
};

class SessionIdAllocatorStub final : public SessionIdAllocator {
public:
    explicit SessionIdAllocatorStub(SessionId start = 1U)
        : next_{start == kNoSession ? 1U : start}
    {
    }

    SessionId allocate() override
    {
        return next_++;
    }

    SessionId peek_next() const noexcept override
    {
        return next_;
    }

private:
    SessionId next_ = 1U;
};

}  // namespace rowscan::txn
