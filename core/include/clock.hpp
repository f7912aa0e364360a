#pragma once

#include "datatypes.hpp"

namespace core {

    // Time source for every scheduled decision, swapped for a manual clock in tests
    class IClock {
    public:
        virtual ~IClock() = default;
        virtual Timestamp now() const = 0;
    };

    class SystemClock : public IClock {
    public:
        Timestamp now() const override { return std::chrono::system_clock::now(); }
    };

} // namespace core
