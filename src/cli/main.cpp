#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "nectar/chunk/content.hpp"
#include "nectar/chunk/file.hpp"
#include "nectar/chunk/single_owner.hpp"
#include "nectar/cli/commands.hpp"
#include "nectar/cli/options.hpp"
#include "nectar/core/config.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/hex.hpp"
#include "nectar/core/log.hpp"
#include "nectar/crypto/signer.hpp"
#include "nectar/postage/accountant.hpp"
#include "nectar/postage/batch_builder.hpp"
#include "nectar/postage/stamp.hpp"

using nectar::cli::OptionId;
using nectar::cli::OptionType;
using nectar::core::Status;
using nectar::core::StatusCode;
using nectar::core::StatusDomain;

// ========================================================================
// Option table
// ========================================================================

static const nectar::cli::OptionSpec kOptions[] = {
    {OptionId::Key, OptionType::String, "key", 'k'},
    {OptionId::Id, OptionType::String, "id", '\0'},
    {OptionId::Batch, OptionType::String, "batch", 'b'},
    {OptionId::Owner, OptionType::String, "owner", '\0'},
    {OptionId::Depth, OptionType::I64, "depth", 'd'},
    {OptionId::BucketDepth, OptionType::I64, "bucket-depth", '\0'},
    {OptionId::Timestamp, OptionType::I64, "timestamp", 't'},
    {OptionId::Span, OptionType::I64, "span", '\0'},
    {OptionId::Size, OptionType::I64, "size", '\0'},
    {OptionId::Value, OptionType::String, "value", '\0'},
    {OptionId::Price, OptionType::String, "price", '\0'},
    {OptionId::Duration, OptionType::I64, "duration", '\0'},
    {OptionId::Immutable, OptionType::Flag, "immutable", '\0'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
};
static constexpr nectar::core::u32 kOptionCount = sizeof(kOptions) / sizeof(kOptions[0]);
static constexpr nectar::core::u32 kMaxParsedOptions = 32;

struct CommandContext {
    nectar::core::NetworkConfig cfg;
    nectar::cli::ParsedOption buf[kMaxParsedOptions]{};
    nectar::cli::ParsedOptions opts{buf, 0, kMaxParsedOptions};
    // Positional arguments after the options.
    nectar::cli::CliArgs rest{};
};

// ========================================================================
// Output helpers
// ========================================================================

static void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

static void print_status_error(const char* context, Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s, domain=%s, aux=%u, limit=%u)\n",
            context,
            nectar::core::status_code_name(s.code),
            nectar::core::status_domain_name(s.domain),
            s.aux,
            s.limit);
}

// ========================================================================
// Input helpers
// ========================================================================

static Status read_file(const char* path, std::vector<nectar::core::u8>* out) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        return nectar::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    out->clear();
    nectar::core::u8 chunk[8192];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
        out->insert(out->end(), chunk, chunk + n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);

    if (failed) {
        return nectar::core::make_status(StatusDomain::Cli, StatusCode::Io);
    }
    if (out->size() > UINT32_MAX) {
        return nectar::core::make_status(StatusDomain::Cli, StatusCode::SizeExceeded);
    }
    return nectar::core::ok_status();
}

static nectar::core::BufferView view_of(const std::vector<nectar::core::u8>& v) {
    return nectar::core::BufferView{v.data(), static_cast<nectar::core::u32>(v.size())};
}

static const char* string_option(const CommandContext& ctx, OptionId id) {
    const nectar::cli::ParsedOption* o = nectar::cli::find_option(ctx.opts, id);
    return o ? o->value.str : nullptr;
}

static bool int_option(const CommandContext& ctx, OptionId id, nectar::core::i64* out) {
    const nectar::cli::ParsedOption* o = nectar::cli::find_option(ctx.opts, id);
    if (!o) {
        return false;
    }
    *out = o->value.i64v;
    return true;
}

static bool flag_option(const CommandContext& ctx, OptionId id) {
    return nectar::cli::find_option(ctx.opts, id) != nullptr;
}

// Signer from --key, or a fresh random key.
static Status make_signer(const CommandContext& ctx, std::unique_ptr<nectar::crypto::LocalSigner>* out) {
    const char* key_hex = string_option(ctx, OptionId::Key);
    if (!key_hex) {
        nectar::core::log_warn("cli", "no --key given, using a random key");
        return nectar::crypto::LocalSigner::random(out);
    }
    nectar::crypto::PrivateKey key{};
    if (!nectar::core::from_hex(key_hex, &key)) {
        return nectar::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    const Status s = nectar::crypto::LocalSigner::create(key, out);
    OPENSSL_cleanse(key.b.data(), key.b.size());
    return s;
}

// Data bytes from the single positional file argument.
static bool read_input(const CommandContext& ctx, const char* command, std::vector<nectar::core::u8>* out) {
    if (ctx.rest.argc != 1 || ctx.rest.argv[0] == nullptr) {
        fprintf(stderr, "error: %s: expected exactly one file\n", command);
        return false;
    }
    const Status s = read_file(ctx.rest.argv[0], out);
    if (!nectar::core::is_ok(s)) {
        fprintf(stderr, "error: %s: cannot read %s\n", command, ctx.rest.argv[0]);
        return false;
    }
    return true;
}

// Depth and bucket depth options share the same range check.
static bool depth_option(const CommandContext& ctx, OptionId id, nectar::core::u8* out) {
    nectar::core::i64 v = 0;
    if (!int_option(ctx, id, &v)) {
        return false;
    }
    if (v < 0 || v > 255) {
        return false;
    }
    *out = static_cast<nectar::core::u8>(v);
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

static void handle_help() {
    printf("Usage: nectar <command> [options] [file]\n\n");
    printf("Commands:\n");
    printf("  address [--span N] <file>      Chunk address (file root address above 4096 bytes)\n");
    printf("  soc --id HEX [-k KEY] <file>   Build a single-owner chunk over the file contents\n");
    printf("  stamp -b HEX -d N [--bucket-depth N] [-t MS] [--immutable] [-k KEY] <file>\n");
    printf("                                 Issue a postage stamp for the file's address\n");
    printf("  batch (--depth N | --size BYTES) (--value V | --price P --duration SECS)\n");
    printf("        [--id HEX] [--owner HEX | -k KEY] [--bucket-depth N] [--immutable]\n");
    printf("                                 Derive a batch through the builder\n");
    printf("  help                           Show this help\n");
    printf("\n");
    printf("Options: -v/--verbose enables debug logging. Hex accepts an optional 0x prefix.\n");
    printf("Environment: NECTAR_BLOCK_TIME, NECTAR_BUCKET_DEPTH, NECTAR_LOG_LEVEL\n");
}

static int handle_address(const CommandContext& ctx) {
    std::vector<nectar::core::u8> data;
    if (!read_input(ctx, "address", &data)) {
        return EXIT_FAILURE;
    }

    nectar::core::i64 span = 0;
    if (int_option(ctx, OptionId::Span, &span)) {
        if (span < 0) {
            print_error("address: --span must be non-negative");
            return EXIT_FAILURE;
        }
        nectar::chunk::ContentChunk chunk;
        const Status s = nectar::chunk::content_chunk_with_span(static_cast<nectar::core::Span>(span), view_of(data),
            &chunk);
        if (!nectar::core::is_ok(s)) {
            print_status_error("address", s);
            return EXIT_FAILURE;
        }
        printf("%s\n", nectar::core::to_hex(chunk.address()).c_str());
        return EXIT_SUCCESS;
    }

    nectar::chunk::FileTree tree;
    const Status s = nectar::chunk::split_file(view_of(data), &tree);
    if (!nectar::core::is_ok(s)) {
        print_status_error("address", s);
        return EXIT_FAILURE;
    }
    nectar::core::log_info("cli", "%u leaves, %zu chunks", tree.leaf_count, tree.chunks.size());
    printf("%s\n", nectar::core::to_hex(tree.root).c_str());
    return EXIT_SUCCESS;
}

static int handle_soc(const CommandContext& ctx) {
    const char* id_hex = string_option(ctx, OptionId::Id);
    nectar::core::SocId id{};
    if (!id_hex || !nectar::core::from_hex(id_hex, &id)) {
        print_error("soc: --id must be 32 bytes of hex");
        return EXIT_FAILURE;
    }

    std::vector<nectar::core::u8> data;
    if (!read_input(ctx, "soc", &data)) {
        return EXIT_FAILURE;
    }

    std::unique_ptr<nectar::crypto::LocalSigner> signer;
    Status s = make_signer(ctx, &signer);
    if (!nectar::core::is_ok(s)) {
        print_status_error("soc: key", s);
        return EXIT_FAILURE;
    }

    nectar::chunk::SingleOwnerChunk soc;
    s = nectar::chunk::soc_new(id, view_of(data), *signer, &soc);
    if (!nectar::core::is_ok(s)) {
        print_status_error("soc", s);
        return EXIT_FAILURE;
    }

    const std::vector<nectar::core::u8> wire = soc.to_bytes();
    printf("address   %s\n", nectar::core::to_hex(soc.address()).c_str());
    printf("owner     %s\n", nectar::core::to_hex(soc.owner()).c_str());
    printf("signature %s\n", nectar::core::to_hex(soc.signature()).c_str());
    printf("wire      %s\n", nectar::core::hex_encode(wire.data(), wire.size()).c_str());
    return EXIT_SUCCESS;
}

static int handle_stamp(const CommandContext& ctx) {
    nectar::postage::Batch batch;
    const char* batch_hex = string_option(ctx, OptionId::Batch);
    if (!batch_hex || !nectar::core::from_hex(batch_hex, &batch.id)) {
        print_error("stamp: --batch must be 32 bytes of hex");
        return EXIT_FAILURE;
    }
    if (!depth_option(ctx, OptionId::Depth, &batch.depth)) {
        print_error("stamp: --depth is required");
        return EXIT_FAILURE;
    }
    if (!depth_option(ctx, OptionId::BucketDepth, &batch.bucket_depth)) {
        batch.bucket_depth = ctx.cfg.default_bucket_depth;
    }
    batch.immutable = flag_option(ctx, OptionId::Immutable);

    std::optional<nectar::core::Timestamp> timestamp;
    nectar::core::i64 ts = 0;
    if (int_option(ctx, OptionId::Timestamp, &ts)) {
        if (ts < 0) {
            print_error("stamp: --timestamp must be non-negative");
            return EXIT_FAILURE;
        }
        timestamp = static_cast<nectar::core::Timestamp>(ts);
    }

    std::vector<nectar::core::u8> data;
    if (!read_input(ctx, "stamp", &data)) {
        return EXIT_FAILURE;
    }
    nectar::chunk::FileTree tree;
    Status s = nectar::chunk::split_file(view_of(data), &tree);
    if (!nectar::core::is_ok(s)) {
        print_status_error("stamp: chunking", s);
        return EXIT_FAILURE;
    }

    std::unique_ptr<nectar::crypto::LocalSigner> signer;
    s = make_signer(ctx, &signer);
    if (!nectar::core::is_ok(s)) {
        print_status_error("stamp: key", s);
        return EXIT_FAILURE;
    }
    batch.owner = signer->address();

    std::unique_ptr<nectar::postage::BucketAccountant> accountant;
    s = nectar::postage::BucketAccountant::create(batch, std::move(signer), &accountant);
    if (!nectar::core::is_ok(s)) {
        print_status_error("stamp: batch", s);
        return EXIT_FAILURE;
    }

    nectar::postage::Stamp stamp;
    s = accountant->stamp(tree.root, timestamp, &stamp);
    if (!nectar::core::is_ok(s)) {
        print_status_error("stamp", s);
        return EXIT_FAILURE;
    }

    const auto bytes = nectar::postage::stamp_to_bytes(stamp);
    nectar::core::log_info("cli", "chunk %s bucket %u index %u", nectar::core::to_hex(tree.root).c_str(), stamp.index.x,
        stamp.index.y);
    printf("%s\n", nectar::core::hex_encode(bytes.data(), bytes.size()).c_str());
    return EXIT_SUCCESS;
}

static int handle_batch(const CommandContext& ctx) {
    nectar::postage::BatchBuilder builder(ctx.cfg);

    nectar::core::BatchId id{};
    const char* id_hex = string_option(ctx, OptionId::Id);
    if (id_hex) {
        if (!nectar::core::from_hex(id_hex, &id)) {
            print_error("batch: --id must be 32 bytes of hex");
            return EXIT_FAILURE;
        }
    } else if (RAND_bytes(id.b.data(), static_cast<int>(id.b.size())) != 1) {
        print_error("batch: cannot generate a batch id");
        return EXIT_FAILURE;
    }
    Status s = builder.id(id);

    const char* owner_hex = string_option(ctx, OptionId::Owner);
    if (nectar::core::is_ok(s) && owner_hex) {
        nectar::core::Address owner{};
        if (!nectar::core::from_hex(owner_hex, &owner)) {
            print_error("batch: --owner must be 20 bytes of hex");
            return EXIT_FAILURE;
        }
        s = builder.owner(owner);
    } else if (nectar::core::is_ok(s)) {
        std::unique_ptr<nectar::crypto::LocalSigner> signer;
        s = make_signer(ctx, &signer);
        if (nectar::core::is_ok(s)) {
            s = builder.signer(*signer);
        }
    }

    nectar::core::u8 bucket_depth = 0;
    if (nectar::core::is_ok(s) && depth_option(ctx, OptionId::BucketDepth, &bucket_depth)) {
        s = builder.bucket_depth(bucket_depth);
    }

    nectar::core::u8 depth = 0;
    nectar::core::i64 size = 0;
    if (nectar::core::is_ok(s)) {
        if (depth_option(ctx, OptionId::Depth, &depth)) {
            s = builder.depth(depth);
        } else if (int_option(ctx, OptionId::Size, &size) && size >= 0) {
            s = builder.auto_size(static_cast<nectar::core::u64>(size));
        } else {
            print_error("batch: one of --depth or --size is required");
            return EXIT_FAILURE;
        }
    }

    if (nectar::core::is_ok(s)) {
        const char* value_dec = string_option(ctx, OptionId::Value);
        const char* price_dec = string_option(ctx, OptionId::Price);
        nectar::core::i64 duration = 0;
        nectar::core::U256 amount{};
        if (value_dec) {
            if (!nectar::core::u256_from_dec(value_dec, &amount)) {
                print_error("batch: --value must be a decimal integer");
                return EXIT_FAILURE;
            }
            s = builder.value(amount);
        } else if (price_dec && int_option(ctx, OptionId::Duration, &duration) && duration >= 0) {
            if (!nectar::core::u256_from_dec(price_dec, &amount)) {
                print_error("batch: --price must be a decimal integer");
                return EXIT_FAILURE;
            }
            s = builder.value_for_duration(amount, static_cast<nectar::core::u64>(duration));
        } else {
            print_error("batch: --value or --price with --duration is required");
            return EXIT_FAILURE;
        }
    }

    builder.immutable(flag_option(ctx, OptionId::Immutable));

    nectar::postage::Batch batch;
    if (nectar::core::is_ok(s)) {
        s = builder.build(&batch);
    }
    if (!nectar::core::is_ok(s)) {
        if (s.code == StatusCode::OutOfOrder || s.code == StatusCode::MissingField) {
            fprintf(stderr, "error: batch: %s (%s)\n", nectar::core::status_code_name(s.code),
                nectar::postage::batch_field_name(static_cast<nectar::postage::BatchField>(s.aux)));
        } else {
            print_status_error("batch", s);
        }
        return EXIT_FAILURE;
    }

    printf("id           %s\n", nectar::core::to_hex(batch.id).c_str());
    printf("owner        %s\n", nectar::core::to_hex(batch.owner).c_str());
    printf("depth        %u\n", static_cast<unsigned>(batch.depth));
    printf("bucket_depth %u\n", static_cast<unsigned>(batch.bucket_depth));
    printf("chunks       %llu\n", static_cast<unsigned long long>(nectar::postage::batch_chunks(batch.depth)));
    printf("value        %s\n", nectar::core::u256_to_dec(batch.value).c_str());
    printf("immutable    %s\n", batch.immutable ? "true" : "false");
    return EXIT_SUCCESS;
}

// ========================================================================
// Entry point
// ========================================================================

int main(int argc, char** argv) {
    nectar::cli::CommandSpec commands[] = {
        {nectar::cli::CommandId::Help, "help"},
        {nectar::cli::CommandId::Address, "address"},
        {nectar::cli::CommandId::Soc, "soc"},
        {nectar::cli::CommandId::Stamp, "stamp"},
        {nectar::cli::CommandId::Batch, "batch"},
    };
    const nectar::core::u32 command_count = sizeof(commands) / sizeof(commands[0]);

    CommandContext ctx;
    Status s = nectar::core::config_from_env(&ctx.cfg);
    if (!nectar::core::is_ok(s)) {
        print_status_error("configuration", s);
        return EXIT_FAILURE;
    }
    nectar::core::config_apply(ctx.cfg);

    if (argc < 2) {
        handle_help();
        return EXIT_FAILURE;
    }

    nectar::cli::CommandInvocation cmd;
    nectar::core::u32 consumed = 0;
    const nectar::cli::CliArgs args{argv + 1, static_cast<nectar::core::u32>(argc - 1)};
    s = nectar::cli::parse_command(args, commands, command_count, &cmd, &consumed);
    if (!nectar::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s'\n", argv[1]);
        return EXIT_FAILURE;
    }

    s = nectar::cli::parse_options(cmd.args, kOptions, kOptionCount, &ctx.opts, &consumed);
    if (!nectar::core::is_ok(s)) {
        const char* bad = s.aux < cmd.args.argc ? cmd.args.argv[s.aux] : "?";
        fprintf(stderr, "error: bad option '%s'\n", bad);
        return EXIT_FAILURE;
    }
    ctx.rest.argv = cmd.args.argv + consumed;
    ctx.rest.argc = cmd.args.argc - consumed;

    if (flag_option(ctx, OptionId::Verbose)) {
        nectar::core::log_set_level(nectar::core::LogLevel::Debug);
    }

    switch (cmd.id) {
        case nectar::cli::CommandId::Help:
            handle_help();
            return EXIT_SUCCESS;
        case nectar::cli::CommandId::Address:
            return handle_address(ctx);
        case nectar::cli::CommandId::Soc:
            return handle_soc(ctx);
        case nectar::cli::CommandId::Stamp:
            return handle_stamp(ctx);
        case nectar::cli::CommandId::Batch:
            return handle_batch(ctx);
        case nectar::cli::CommandId::None:
            break;
    }
    handle_help();
    return EXIT_FAILURE;
}
