#pragma once

#include <string>
#include <core/types.hpp>

// Interactive input helpers. EOF, Ctrl-C and Ctrl-D all come back as
// UserCancelled so a command can stop before touching the database.

// Read one line. An empty answer yields `default_val`.
Result<std::string> prompt_line(const std::string& label, const std::string& default_val = "");

// Read a line, asking again until the answer is non-empty.
Result<std::string> prompt_required(const std::string& label);

// Yes/no question. An empty answer yields `default_yes`.
Result<bool> prompt_confirm(const std::string& label, bool default_yes = false);

// Read a secret with echo off (when stdin is a terminal).
Result<std::string> prompt_secret(const std::string& label);

// Read a secret twice, asking again until both entries match.
Result<std::string> prompt_secret_confirmed(const std::string& label,
                                            const std::string& confirm_label);
