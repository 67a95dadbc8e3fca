#include <array>

#include <gtest/gtest.h>

#include "nectar/cli/commands.hpp"

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const std::array<nectar::cli::CommandSpec, 3> specs = {{
        {nectar::cli::CommandId::Help, "help"},
        {nectar::cli::CommandId::Address, "address"},
        {nectar::cli::CommandId::Stamp, "stamp"},
    }};

    const char* argv[] = {"stamp", "--batch", "0xab", "file.bin"};
    const nectar::cli::CliArgs args{argv, 4};

    nectar::cli::CommandInvocation out{};
    nectar::cli::u32 consumed = 0;
    const nectar::core::Status s = nectar::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, nectar::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, nectar::cli::CommandId::Stamp);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "--batch");
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const std::array<nectar::cli::CommandSpec, 1> specs = {{{nectar::cli::CommandId::Help, "help"}}};
    const char* argv[] = {"nope"};
    nectar::cli::CommandInvocation out{};
    nectar::cli::u32 consumed = 0;
    const nectar::core::Status s = nectar::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, nectar::core::StatusCode::NotFound);
    EXPECT_EQ(s.domain, nectar::core::StatusDomain::Cli);
    EXPECT_EQ(out.id, nectar::cli::CommandId::None);
}

TEST(CliCommands, InvalidOnMissingOrOptionLikeCommand) {
    const std::array<nectar::cli::CommandSpec, 1> specs = {{{nectar::cli::CommandId::Help, "help"}}};
    nectar::cli::CommandInvocation out{};
    nectar::cli::u32 consumed = 0;

    nectar::core::Status s = nectar::cli::parse_command({nullptr, 0}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, nectar::core::StatusCode::Invalid);

    const char* argv[] = {"--help"};
    s = nectar::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, nectar::core::StatusCode::Invalid);
    EXPECT_EQ(consumed, 0u);
}
