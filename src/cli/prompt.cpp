#include "prompt.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <platform/terminal.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <readline/readline.h>

static const char* CANCELLED_MSG = "Operation cancelled by user";

// Readline uses \001 and \002 to wrap non-printing chars so it can
// compute the visible prompt width correctly for cursor positioning.
static std::string rl_esc(const std::string& code) {
    return std::string("\001") + code + std::string("\002");
}

Result<std::string> prompt_line(const std::string& label, const std::string& default_val) {
    std::string suffix = default_val.empty() ? ": " : " [" + default_val + "]: ";
    std::string prompt = rl_esc(theme::color::ORANGE) + "    " + label + suffix
                       + rl_esc(theme::color::RESET);

    char* raw = readline(prompt.c_str());
    if (!raw) {
        std::cout << "\n";
        return Result<std::string>::Err(ErrorKind::UserCancelled, CANCELLED_MSG);
    }
    std::string answer = raw;
    free(raw);

    if (answer.empty()) return Result<std::string>::Ok(default_val);
    return Result<std::string>::Ok(answer);
}

Result<std::string> prompt_required(const std::string& label) {
    while (true) {
        auto answer = prompt_line(label);
        if (answer.is_err() || !answer.value.empty()) return answer;
        std::cout << theme::warn("A value is required.");
    }
}

Result<bool> prompt_confirm(const std::string& label, bool default_yes) {
    std::string hint = default_yes ? " [Y/n]" : " [y/N]";
    while (true) {
        auto answer = prompt_line(label + hint);
        if (answer.is_err()) return Result<bool>::Err(answer);

        std::string a = answer.value;
        std::transform(a.begin(), a.end(), a.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (a.empty()) return Result<bool>::Ok(default_yes);
        if (a == "y" || a == "yes") return Result<bool>::Ok(true);
        if (a == "n" || a == "no") return Result<bool>::Ok(false);
        std::cout << theme::warn("Please answer y or n.");
    }
}

Result<std::string> prompt_secret(const std::string& label) {
    std::cout << theme::color::ORANGE << "    " << label << ": " << theme::color::RESET;
    std::cout.flush();

    bool tty = platform::stdin_is_tty();
    std::string secret;
    bool cancelled = false;
    {
        // Echo is only touched on a real terminal; piped input is read as-is.
        std::unique_ptr<platform::NoEchoGuard> guard;
        if (tty) guard = std::make_unique<platform::NoEchoGuard>();

        // Read character by character (no echo, no canonical)
        while (true) {
            if (tty && !platform::poll_stdin(SECRET_INPUT_TIMEOUT_MS)) {
                cancelled = true;
                break;
            }
            char c;
            if (!platform::read_stdin_byte(c)) {
                cancelled = secret.empty();
                break;
            }
            if (c == '\n' || c == '\r') break;
            if (c == 3) {                       // Ctrl-C
                cancelled = true;
                break;
            }
            if (c == 4) {                       // Ctrl-D
                if (secret.empty()) cancelled = true;
                break;
            }
            if (c == 127 || c == 8) {           // backspace
                if (!secret.empty()) secret.pop_back();
                continue;
            }
            if (static_cast<unsigned char>(c) >= 32) secret += c;
        }
    }

    std::cout << "\n";
    if (cancelled) {
        return Result<std::string>::Err(ErrorKind::UserCancelled, CANCELLED_MSG);
    }
    return Result<std::string>::Ok(secret);
}

Result<std::string> prompt_secret_confirmed(const std::string& label,
                                            const std::string& confirm_label) {
    while (true) {
        auto first = prompt_secret(label);
        if (first.is_err()) return first;
        if (first.value.empty()) {
            std::cout << theme::warn("A secret is required.");
            continue;
        }
        auto second = prompt_secret(confirm_label);
        if (second.is_err()) return second;

        if (first.value == second.value) return first;
        std::cout << theme::fail("Secrets don't match");
    }
}
