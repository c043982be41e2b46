#pragma once
#include "tether/models/proto_time.hpp"

namespace tether::interfaces {

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual models::TimePoint Now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] models::TimePoint Now() const override {
        return std::chrono::system_clock::now();
    }
};

}
