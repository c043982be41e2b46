#pragma once

#include "tether/core/constants.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace tether::configuration {

/**
 * @brief Runtime knobs for one messenger instance
 *
 * Cryptographic parameters are not configurable; they live in
 * core/constants.hpp because changing them breaks interoperability.
 *
 * Delivery normally advances only on a backend acknowledgement. A simulated
 * delivery delay is an explicit opt-in for running without a relay: the
 * sweep then promotes Sent messages to Delivered once the delay has passed.
 *
 * @code
 * auto config = MessengerConfig::Default();
 * config.SetDefaultAutoDeleteMinutes(5);
 *
 * auto offline = MessengerConfig::WithSimulatedDelivery(std::chrono::seconds(2));
 * @endcode
 */
class MessengerConfig {
public:
    [[nodiscard]] static MessengerConfig Default() noexcept {
        return MessengerConfig();
    }

    [[nodiscard]] static MessengerConfig WithSimulatedDelivery(std::chrono::milliseconds delay) noexcept {
        MessengerConfig config;
        config.simulated_delivery_delay_ = delay;
        return config;
    }

    [[nodiscard]] std::chrono::seconds GetInviteTtl() const noexcept { return invite_ttl_; }

    [[nodiscard]] std::chrono::milliseconds GetSweepInterval() const noexcept { return sweep_interval_; }

    [[nodiscard]] const std::optional<std::chrono::milliseconds>& GetSimulatedDeliveryDelay() const noexcept {
        return simulated_delivery_delay_;
    }

    [[nodiscard]] uint32_t GetDefaultAutoDeleteMinutes() const noexcept { return default_auto_delete_minutes_; }

    [[nodiscard]] static constexpr uint32_t GetMinGroupMembers() noexcept { return InviteConstants::MIN_GROUP_MEMBERS; }
    [[nodiscard]] static constexpr uint32_t GetMaxGroupMembers() noexcept { return InviteConstants::MAX_GROUP_MEMBERS; }

    /// Zero or negative values are ignored.
    void SetInviteTtl(std::chrono::seconds ttl) noexcept {
        if (ttl.count() > 0) {
            invite_ttl_ = ttl;
        }
    }

    void SetSweepInterval(std::chrono::milliseconds interval) noexcept {
        if (interval.count() > 0) {
            sweep_interval_ = interval;
        }
    }

    void SetDefaultAutoDeleteMinutes(uint32_t minutes) noexcept { default_auto_delete_minutes_ = minutes; }

    void DisableSimulatedDelivery() noexcept { simulated_delivery_delay_.reset(); }

    [[nodiscard]] bool IsDeliverySimulated() const noexcept { return simulated_delivery_delay_.has_value(); }

private:
    MessengerConfig() noexcept = default;

    std::chrono::seconds invite_ttl_ = InviteConstants::DEFAULT_INVITE_TTL;
    std::chrono::milliseconds sweep_interval_ = std::chrono::seconds(10);
    std::optional<std::chrono::milliseconds> simulated_delivery_delay_;
    uint32_t default_auto_delete_minutes_ = 0;
};

}
