#include "nectar/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace nectar::core {
    namespace {
        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (s == nullptr || out == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] const char* env_value(const char* name) noexcept {
            const char* v = std::getenv(name);
            if (v == nullptr || v[0] == '\0') {
                return nullptr;
            }
            return v;
        }
    } // namespace

    Status config_from_env(NetworkConfig* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        NetworkConfig cfg = default_network_config();

        if (const char* v = env_value("NECTAR_BLOCK_TIME")) {
            u64 block_time = 0;
            if (!parse_u64(v, &block_time) || block_time == 0) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(ConfigKey::BlockTime));
            }
            cfg.block_time_seconds = block_time;
        }

        if (const char* v = env_value("NECTAR_BUCKET_DEPTH")) {
            u64 depth = 0;
            if (!parse_u64(v, &depth) || depth < kMinBucketDepth || depth > 32) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(ConfigKey::BucketDepth));
            }
            cfg.default_bucket_depth = static_cast<u8>(depth);
        }

        if (const char* v = env_value("NECTAR_LOG_LEVEL")) {
            LogLevel level{};
            if (!log_level_parse(v, &level)) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, static_cast<u32>(ConfigKey::Log));
            }
            cfg.log_level = level;
        }

        *out = cfg;
        return ok_status();
    }

    void config_apply(const NetworkConfig& cfg) noexcept {
        log_set_level(cfg.log_level);
    }
} // namespace nectar::core
