#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <termios.h>
#include <unistd.h>

#include "seedvault/cli/commands.hpp"
#include "seedvault/cli/options.hpp"
#include "seedvault/core/clock.hpp"
#include "seedvault/core/errors.hpp"
#include "seedvault/core/log.hpp"
#include "seedvault/security/secure_key.hpp"
#include "seedvault/vault/export.hpp"

// ========================================================================
// File I/O Utilities
// ========================================================================

static seedvault::core::Status read_file(const char* path, std::string* out) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::NotFound);
    }

    std::string data;
    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        data.append(buf, n);
        if (data.size() > seedvault::core::kMaxPayloadBytes) {
            fclose(f);
            return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Invalid);
        }
    }
    const bool failed = ferror(f) != 0;
    fclose(f);
    if (failed) {
        return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Transport);
    }

    *out = std::move(data);
    return seedvault::core::ok_status();
}

static seedvault::core::Status write_output(const char* path, const std::string& data) {
    if (!path) {
        fwrite(data.data(), 1, data.size(), stdout);
        fputc('\n', stdout);
        return seedvault::core::ok_status();
    }

    FILE* f = fopen(path, "wb");
    if (!f) {
        return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Transport);
    }
    const size_t written = fwrite(data.data(), 1, data.size(), f);
    const int closed = fclose(f);
    if (written != data.size() || closed != 0) {
        return seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Transport);
    }
    return seedvault::core::ok_status();
}

// ========================================================================
// Password Input
// ========================================================================

// SEEDVAULT_PASSWORD, else a no-echo prompt on the terminal.
static std::optional<std::string> read_password(const char* prompt) {
    if (const char* env = std::getenv("SEEDVAULT_PASSWORD"); env && *env) {
        return std::string(env);
    }
    if (!isatty(STDIN_FILENO)) {
        return std::nullopt;
    }

    fprintf(stderr, "%s", prompt);
    fflush(stderr);

    termios old_tio{};
    const bool have_tio = tcgetattr(STDIN_FILENO, &old_tio) == 0;
    if (have_tio) {
        termios tio = old_tio;
        tio.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &tio);
    }

    char line[1024];
    const bool got = fgets(line, sizeof(line), stdin) != nullptr;

    if (have_tio) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_tio);
    }
    fputc('\n', stderr);

    if (!got) {
        seedvault::security::wipe_bytes(line, sizeof(line));
        return std::nullopt;
    }
    size_t len = std::strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
        --len;
    }
    std::string password(line, len);
    seedvault::security::wipe_bytes(line, sizeof(line));
    return password;
}

// ========================================================================
// Error Reporting
// ========================================================================

static void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

static void print_status_error(const char* context, seedvault::core::Status s) {
    fprintf(stderr, "error: %s failed: %s (code=%u, domain=%s)\n",
            context,
            seedvault::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            seedvault::core::status_domain_name(s.domain));
}

// ========================================================================
// Command Handlers
// ========================================================================

static void handle_help() {
    printf("usage: seedvault <command> [options]\n\n");
    printf("Commands:\n");
    printf("  seal --in FILE [--out FILE]    Encrypt a vault document\n");
    printf("  open --in FILE [--out FILE]    Decrypt the output of seal\n");
    printf("  export --in FILE --out FILE    Write an encrypted backup file\n");
    printf("  import --in FILE [--out FILE]  Decrypt a backup file\n");
    printf("  strength                       Rate a password\n");
    printf("  help                           Show this help\n\n");
    printf("Options:\n");
    printf("  -i, --in FILE                  Input file\n");
    printf("  -o, --out FILE                 Output file (default: stdout)\n");
    printf("  --iterations N                 PBKDF2 iterations (default 500000, min 100000)\n\n");
    printf("The master password is read from SEEDVAULT_PASSWORD or prompted for.\n");
}

static int run_command(seedvault::cli::CommandId id, const seedvault::cli::ParsedOptions& opts) {
    using seedvault::cli::CommandId;
    using seedvault::cli::OptionId;

    if (id == CommandId::Help || seedvault::cli::find_option(opts, OptionId::Help)) {
        handle_help();
        return EXIT_SUCCESS;
    }

    const seedvault::cli::ParsedOption* in_opt = seedvault::cli::find_option(opts, OptionId::In);
    const seedvault::cli::ParsedOption* out_opt = seedvault::cli::find_option(opts, OptionId::Out);
    const char* out_path = out_opt ? out_opt->value.str : nullptr;

    seedvault::security::KdfParams params{};
    seedvault::core::Status s = seedvault::cli::kdf_params_from_options(opts, &params);
    if (!seedvault::core::is_ok(s)) {
        print_error("--iterations must be at least 100000");
        return EXIT_FAILURE;
    }

    if (id != CommandId::Strength && !in_opt) {
        print_error("--in is required");
        return EXIT_FAILURE;
    }
    if (id == CommandId::Export && !out_path) {
        print_error("export: --out is required");
        return EXIT_FAILURE;
    }

    std::string input;
    if (in_opt) {
        s = read_file(in_opt->value.str, &input);
        if (!seedvault::core::is_ok(s)) {
            fprintf(stderr, "error: cannot read %s\n", in_opt->value.str);
            return EXIT_FAILURE;
        }
    }

    std::optional<std::string> password = read_password("Master password: ");
    if (!password) {
        print_error("no password (set SEEDVAULT_PASSWORD or run on a terminal)");
        return EXIT_FAILURE;
    }

    std::string output;
    switch (id) {
        case CommandId::Seal:
            s = seedvault::cli::run_seal(*password, input, params, &output);
            break;
        case CommandId::Open:
            s = seedvault::cli::run_open(*password, input, params, &output);
            break;
        case CommandId::Export:
            s = seedvault::vault::export_vault_file(*password, input,
                seedvault::core::system_clock().now_ms(), params, &output);
            break;
        case CommandId::Import: {
            std::optional<std::string> doc = seedvault::vault::import_vault_file(*password, input, params);
            if (doc) {
                output = std::move(*doc);
            } else {
                s = seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Authentication);
            }
            break;
        }
        case CommandId::Strength:
            output = seedvault::cli::strength_line(*password);
            break;
        default:
            s = seedvault::core::make_status(seedvault::core::StatusDomain::Cli, seedvault::core::StatusCode::Unsupported);
            break;
    }
    seedvault::security::wipe_string(&*password);

    if (s.code == seedvault::core::StatusCode::Authentication) {
        print_error("wrong password or damaged data");
        return EXIT_FAILURE;
    }
    if (!seedvault::core::is_ok(s)) {
        print_status_error("command", s);
        return EXIT_FAILURE;
    }

    s = write_output(out_path, output);
    seedvault::security::wipe_string(&output);
    seedvault::security::wipe_string(&input);
    if (!seedvault::core::is_ok(s)) {
        fprintf(stderr, "error: cannot write %s\n", out_path);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    if (const char* level = std::getenv("SEEDVAULT_LOG_LEVEL"); level && *level) {
        seedvault::core::LogLevel parsed{};
        if (seedvault::core::log_level_parse(level, &parsed)) {
            seedvault::core::log_set_level(parsed);
        } else {
            fprintf(stderr, "warn: ignoring unknown SEEDVAULT_LOG_LEVEL '%s'\n", level);
        }
    }

    static const seedvault::cli::CommandSpec kCommands[] = {
        {seedvault::cli::CommandId::Help, "help"},
        {seedvault::cli::CommandId::Seal, "seal"},
        {seedvault::cli::CommandId::Open, "open"},
        {seedvault::cli::CommandId::Export, "export"},
        {seedvault::cli::CommandId::Import, "import"},
        {seedvault::cli::CommandId::Strength, "strength"},
    };
    static const seedvault::cli::OptionSpec kOptions[] = {
        {seedvault::cli::OptionId::In, seedvault::cli::OptionType::String, "in", 'i'},
        {seedvault::cli::OptionId::Out, seedvault::cli::OptionType::String, "out", 'o'},
        {seedvault::cli::OptionId::Iterations, seedvault::cli::OptionType::I64, "iterations", '\0'},
        {seedvault::cli::OptionId::Help, seedvault::cli::OptionType::Flag, "help", 'h'},
    };

    const seedvault::cli::CliArgs args{argv + 1, static_cast<seedvault::cli::u32>(argc > 0 ? argc - 1 : 0)};
    if (args.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    seedvault::cli::CommandInvocation inv{};
    seedvault::cli::u32 consumed = 0;
    seedvault::core::Status s = seedvault::cli::parse_command(args, kCommands,
        sizeof(kCommands) / sizeof(kCommands[0]), &inv, &consumed);
    if (!seedvault::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try 'seedvault help')\n", argv[1]);
        return EXIT_FAILURE;
    }

    seedvault::cli::ParsedOption storage[16];
    seedvault::cli::ParsedOptions opts{storage, 0, 16};
    s = seedvault::cli::parse_options(inv.args, kOptions, sizeof(kOptions) / sizeof(kOptions[0]), &opts, &consumed);
    if (!seedvault::core::is_ok(s)) {
        print_error("bad option (try 'seedvault help')");
        return EXIT_FAILURE;
    }
    if (consumed != inv.args.argc) {
        fprintf(stderr, "error: unexpected argument '%s'\n", inv.args.argv[consumed]);
        return EXIT_FAILURE;
    }

    return run_command(inv.id, opts);
}
