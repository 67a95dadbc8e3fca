#pragma once

#include <type_traits>

#include "nectar/core/errors.hpp"
#include "nectar/core/log.hpp"
#include "nectar/core/types.hpp"

namespace nectar::core {

    inline constexpr u8 kMinBucketDepth = 16;

    enum class ConfigKey : u32 {
        None = 0,
        BlockTime = 1,
        BucketDepth = 2,
        Log = 3,
    };

    struct NetworkConfig {
        u64 block_time_seconds{5};
        u8 default_bucket_depth{kMinBucketDepth};
        LogLevel log_level{LogLevel::Warn};
    };

    [[nodiscard]] constexpr NetworkConfig default_network_config() noexcept {
        return NetworkConfig{};
    }

    // Reads NECTAR_BLOCK_TIME, NECTAR_BUCKET_DEPTH and NECTAR_LOG_LEVEL over
    // the defaults. A malformed variable fails with Invalid, aux = ConfigKey.
    Status config_from_env(NetworkConfig* out) noexcept;

    // Applies process-wide settings (currently the log level).
    void config_apply(const NetworkConfig& cfg) noexcept;

    static_assert(std::is_trivially_copyable_v<NetworkConfig>);

} // namespace nectar::core
