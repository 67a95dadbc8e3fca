#pragma once

#include <type_traits>

#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"

namespace nectar::cli {
    using nectar::core::u8;
    using nectar::core::u32;
    using nectar::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Key = 1,
        Id = 2,
        Batch = 3,
        Owner = 4,
        Depth = 5,
        BucketDepth = 6,
        Timestamp = 7,
        Span = 8,
        Size = 9,
        Value = 10,
        Price = 11,
        Duration = 12,
        Immutable = 13,
        Verbose = 14,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options up to the first positional argument or "--".
    // consumed receives the number of argv entries used. Cli/Invalid on an
    // unknown option, a missing or malformed value, or when out is full
    // (aux = index of the offending argument).
    nectar::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of id, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace nectar::cli
