#pragma once

#include "toast_types.hpp"

namespace termtoast {

// Monotonic time source used to stamp notifications on creation
class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
};

class SteadyClock : public IClock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace termtoast
