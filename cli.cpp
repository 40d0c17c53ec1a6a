// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cli.cpp
 * @brief Command shell implementation for ux8 v0.1.
 * @details
 * Built-in commands: HELP, ECHO, LS, CAT, STAT, RM, MEM, UNAME, EXIT, WRITE, WHOAMI,
 * DATE, TIME, CLEAR. Each handler writes its own messages and returns 0 or -1.
 *
 * @version 0.1
 * @see cli.hpp, fs.hpp, clock.hpp, session.hpp, console.hpp
 */

#include "cli.hpp"
#include "ux8.hpp"
#include "fs.hpp"
#include "clock.hpp"
#include "session.hpp"
#include "console.hpp"
#include "trace.hpp"
#include "util.hpp"
#include <span>

namespace ux8 {
namespace cli {

CLI g_cli;

namespace {

constexpr size_t HELP_NAME_WIDTH = 6;

void put_line(hal::UARTDriverOps* uart_ops, std::string_view text) {
    for (char c : text) uart_ops->putc(c);
    uart_ops->putc('\n');
}

void put_mem_free(hal::UARTDriverOps* uart_ops) {
    char buf[32];
    util::k_snprintf(buf, sizeof(buf), "MEM FREE: %u\n", static_cast<unsigned>(fs::g_file_system.free_heap_bytes()));
    uart_ops->puts(buf);
}

int cli_help_command(const char*, hal::UARTDriverOps* uart_ops) {
    g_cli.print_help(uart_ops);
    return 0;
}

int cli_echo_command(const char* args, hal::UARTDriverOps* uart_ops) {
    put_line(uart_ops, util::skip_spaces(args));
    return 0;
}

int cli_ls_command(const char*, hal::UARTDriverOps* uart_ops) {
    auto listing = fs::g_file_system.list();
    if (!listing) {
        uart_ops->puts("0\n");
        return 0;
    }
    char buf[48];
    for (size_t i = 0; i < listing->count; ++i) {
        const fs::FileInfo& info = listing->entries[i];
        util::k_snprintf(buf, sizeof(buf), "%s  %u  %s %s\n", info.name.data(),
                         static_cast<unsigned>(info.length), info.date.data(), info.time.data());
        uart_ops->puts(buf);
    }
    return 0;
}

int cli_cat_command(const char* args, hal::UARTDriverOps* uart_ops) {
    std::string_view rest = args;
    std::string_view name = util::get_next_token(rest);
    if (name.empty()) {
        uart_ops->puts("USAGE: CAT FILENAME\n");
        return -1;
    }
    auto content = fs::g_file_system.read(name);
    if (!content) {
        uart_ops->puts("FILE NOT FOUND\n");
        return -1;
    }
    for (uint8_t byte : *content) {
        uart_ops->putc(static_cast<char>(byte));
    }
    uart_ops->putc('\n');
    return 0;
}

int cli_stat_command(const char* args, hal::UARTDriverOps* uart_ops) {
    std::string_view rest = args;
    std::string_view name = util::get_next_token(rest);
    if (name.empty()) {
        uart_ops->puts("USAGE: STAT FILENAME\n");
        return -1;
    }
    auto info = fs::g_file_system.stat(name);
    if (!info) {
        uart_ops->puts("FILE NOT FOUND\n");
        return -1;
    }
    char addr[8];
    util::format_hex16(info->start, addr, sizeof(addr));
    char buf[32];
    util::k_snprintf(buf, sizeof(buf), "NAME: %s\n", info->name.data());
    uart_ops->puts(buf);
    util::k_snprintf(buf, sizeof(buf), "SIZE: %u\n", static_cast<unsigned>(info->length));
    uart_ops->puts(buf);
    util::k_snprintf(buf, sizeof(buf), "ADDR: %s\n", addr);
    uart_ops->puts(buf);
    util::k_snprintf(buf, sizeof(buf), "DATE: %s\n", info->date.data());
    uart_ops->puts(buf);
    util::k_snprintf(buf, sizeof(buf), "TIME: %s\n", info->time.data());
    uart_ops->puts(buf);
    return 0;
}

int cli_rm_command(const char* args, hal::UARTDriverOps* uart_ops) {
    std::string_view rest = args;
    std::string_view name = util::get_next_token(rest);
    if (name.empty()) {
        uart_ops->puts("USAGE: RM FILENAME\n");
        return -1;
    }
    fs::FsStatus status = fs::g_file_system.remove(name);
    put_line(uart_ops, fs::status_name(status));
    return status == fs::FsStatus::OK ? 0 : -1;
}

int cli_mem_command(const char*, hal::UARTDriverOps* uart_ops) {
    put_mem_free(uart_ops);
    return 0;
}

int cli_uname_command(const char*, hal::UARTDriverOps* uart_ops) {
    char buf[48];
    util::k_snprintf(buf, sizeof(buf), "UX8 %s %s\n", VERSION_STRING,
                     g_platform ? g_platform->get_name() : "UNKNOWN");
    uart_ops->puts(buf);
    put_mem_free(uart_ops);
    return 0;
}

int cli_exit_command(const char*, hal::UARTDriverOps*) {
    return CMD_EXIT;
}

int cli_write_command(const char* args, hal::UARTDriverOps* uart_ops) {
    std::string_view rest = args;
    std::string_view name = util::get_next_token(rest);
    if (name.empty()) {
        uart_ops->puts("USAGE: WRITE FILENAME TEXT\n");
        return -1;
    }
    std::string_view text = util::skip_spaces(rest);
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());

    clock::g_clock.detect_rollover();
    fs::FsStatus status = fs::g_file_system.create(name, bytes, clock::g_clock.stamp());
    put_line(uart_ops, fs::status_name(status));
    return status == fs::FsStatus::OK ? 0 : -1;
}

int cli_whoami_command(const char*, hal::UARTDriverOps* uart_ops) {
    uart_ops->puts("USERNAME: ");
    put_line(uart_ops, session::g_session.username());
    return 0;
}

int cli_date_command(const char*, hal::UARTDriverOps* uart_ops) {
    clock::g_clock.detect_rollover();
    put_line(uart_ops, clock::g_clock.date_view());
    return 0;
}

int cli_time_command(const char*, hal::UARTDriverOps* uart_ops) {
    clock::g_clock.detect_rollover();
    char buf[core::TIME_LEN];
    clock::format_time(clock::g_clock.sample_time(), buf);
    put_line(uart_ops, std::string_view(buf, sizeof(buf)));
    return 0;
}

int cli_clear_command(const char*, hal::UARTDriverOps* uart_ops) {
    uart_ops->clear_screen();
    return 0;
}

} // namespace

std::optional<std::string_view> match_keyword(std::string_view line, std::string_view keyword) noexcept {
    if (keyword.empty() || !line.starts_with(keyword)) return std::nullopt;
    std::string_view rest = line.substr(keyword.length());
    if (!rest.empty() && rest.front() != ' ') return std::nullopt;
    return rest;
}

void CLI::init() {
    num_commands_ = 0;
    commands_.fill(Command{});
    register_command("HELP", cli_help_command, "SHOW COMMANDS");
    register_command("ECHO", cli_echo_command, "PRINT TEXT");
    register_command("LS", cli_ls_command, "LIST FILES");
    register_command("CAT", cli_cat_command, "PRINT FILE");
    register_command("STAT", cli_stat_command, "FILE INFO");
    register_command("RM", cli_rm_command, "REMOVE FILE");
    register_command("MEM", cli_mem_command, "FREE MEMORY");
    register_command("UNAME", cli_uname_command, "SYSTEM INFO");
    register_command("EXIT", cli_exit_command, "LEAVE SHELL");
    register_command("WRITE", cli_write_command, "WRITE FILE");
    register_command("WHOAMI", cli_whoami_command, "SHOW USER");
    register_command("DATE", cli_date_command, "SHOW DATE");
    register_command("TIME", cli_time_command, "SHOW TIME");
    register_command("CLEAR", cli_clear_command, "CLEAR SCREEN");
}

bool CLI::register_command(const char* name, CommandHandler handler, const char* help_text) {
    if (!name || !*name || !handler || num_commands_ >= MAX_COMMANDS) {
        return false;
    }
    commands_[num_commands_++] = Command{name, handler, help_text ? help_text : ""};
    return true;
}

int CLI::process_line(const char* line, hal::UARTDriverOps* uart_ops) {
    if (!line || !uart_ops) return -1;

    std::string_view input = util::skip_spaces(line);
    if (input.empty()) return 0;

    for (size_t i = 0; i < num_commands_; ++i) {
        const Command& cmd = commands_[i];
        auto args = match_keyword(input, cmd.name);
        if (args) {
            trace::g_trace_manager.record_event(trace::EventType::COMMAND, cmd.name);
            // args is a suffix of the NUL-terminated line
            return cmd.handler(args->data(), uart_ops);
        }
    }

    trace::g_trace_manager.record_event(trace::EventType::ERROR, input);
    uart_ops->puts("UNKNOWN COMMAND - TYPE 'HELP'\n");
    return -1;
}

int CLI::run(hal::UARTDriverOps* uart_ops) {
    if (!uart_ops) return -1;
    console::LineBuffer line;
    while (true) {
        uart_ops->puts(PROMPT);
        if (!console::read_normalized_line(uart_ops, line)) {
            uart_ops->putc('\n');
            break;
        }
        if (process_line(line.c_str(), uart_ops) == CMD_EXIT) {
            break;
        }
        if (uart_ops->input_closed()) {
            break;
        }
    }
    return 0;
}

void CLI::print_banner(hal::UARTDriverOps* uart_ops) const {
    if (!uart_ops) return;
    char buf[48];
    util::k_snprintf(buf, sizeof(buf), "\nUX8 SHELL %s\n", VERSION_STRING);
    uart_ops->puts(buf);
    uart_ops->puts("TYPE 'HELP' FOR ASSISTANCE\n\n");
}

void CLI::print_help(hal::UARTDriverOps* uart_ops) const {
    if (!uart_ops) return;

    std::array<const Command*, MAX_COMMANDS> sorted{};
    for (size_t i = 0; i < num_commands_; ++i) {
        const Command* cmd = &commands_[i];
        size_t j = i;
        while (j > 0 && std::string_view(sorted[j - 1]->name) > std::string_view(cmd->name)) {
            sorted[j] = sorted[j - 1];
            --j;
        }
        sorted[j] = cmd;
    }

    char buf[48];
    for (size_t i = 0; i < num_commands_; ++i) {
        char name_col[HELP_NAME_WIDTH + 1];
        size_t n = util::min(util::kstrlen(sorted[i]->name), HELP_NAME_WIDTH);
        util::kmemcpy(name_col, sorted[i]->name, n);
        util::kmemset(name_col + n, ' ', HELP_NAME_WIDTH - n);
        name_col[HELP_NAME_WIDTH] = '\0';
        util::k_snprintf(buf, sizeof(buf), "  %s - %s\n", name_col, sorted[i]->help_text);
        uart_ops->puts(buf);
    }
}

} // namespace cli
} // namespace ux8
