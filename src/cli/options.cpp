#include "nectar/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace nectar::cli {
    namespace {
        using nectar::core::Status;

        [[nodiscard]] Status cli_invalid(u32 index) noexcept {
            return nectar::core::make_status(nectar::core::StatusDomain::Cli, nectar::core::StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name,
            std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len
                    && std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool decode_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return true;
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return false;
                    }
                    opt->value.i64v = v;
                    return true;
                }
                case OptionType::Flag:
                    break;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt, u32 index) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid(index);
            }
            out->data[out->len++] = opt;
            return nectar::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid(0);
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid(0);
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            // Inline value: --name=value or -xvalue.
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return cli_invalid(i);
                }
                spec = find_long(specs, spec_count, name, name_len);
                inline_value = eq ? eq + 1 : nullptr;
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                inline_value = tok[2] != '\0' ? tok + 2 : nullptr;
            }
            if (spec == nullptr) {
                return cli_invalid(i);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            const u32 at = i;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return cli_invalid(at);
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid(at);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!decode_value(*spec, value, &opt)) {
                    return cli_invalid(at);
                }
            }

            const Status s = push_option(out, opt, at);
            if (!nectar::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return nectar::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }
} // namespace nectar::cli
