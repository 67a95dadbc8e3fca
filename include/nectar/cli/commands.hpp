#pragma once

#include <type_traits>

#include "nectar/cli/options.hpp"
#include "nectar/core/errors.hpp"

namespace nectar::cli {
    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Address = 2,
        Soc = 3,
        Stamp = 4,
        Batch = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; args receives the remaining arguments.
    nectar::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace nectar::cli
