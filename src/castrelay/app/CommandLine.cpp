#include "app/CommandLine.hpp"

#include <charconv>
#include <cmath>
#include <iostream>
#include <string>

namespace CR::App {

namespace {

auto looks_like_option(std::string_view token) -> bool {
    return token.size() > 1 && token.front() == '-';
}

} // namespace

CommandLine::CommandLine() {
    positional_handler_ = [](std::string_view token) -> ParseError {
        return "unexpected argument '" + std::string{token} + "'";
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, std::function<void()> on_set) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, std::function<ParseError(std::string_view)> on_value) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(on_value);
    register_option(std::move(entry));
}

void CommandLine::add_int(std::string_view name, std::function<void(int)> on_value) {
    add_value(name, [stored = std::string(name), handler = std::move(on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int  value  = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer value";
        }
        handler(value);
        return std::nullopt;
    });
}

void CommandLine::add_double(std::string_view name, std::function<void(double)> on_value) {
    add_value(name, [stored = std::string(name), handler = std::move(on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a numeric value";
        }
        double value  = 0.0;
        auto   result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size() || !std::isfinite(value)) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    });
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        log_error("missing option for alias '" + std::string{target} + "'");
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    errors_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        if (!options_done && raw_token == "--") {
            options_done = true;
            continue;
        }
        if (options_done || !looks_like_option(raw_token)) {
            if (auto error = positional_handler_(raw_token)) {
                log_error(*error);
            }
            continue;
        }

        std::optional<std::string_view> attached_value;
        std::string_view                name       = raw_token;
        auto                            equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            log_error("unknown option '" + std::string{raw_token} + "'");
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }
        if (auto error = entry->value_handler(value)) {
            log_error(*error);
        }
    }
    return errors_.empty();
}

bool CommandLine::had_errors() const {
    return !errors_.empty();
}

auto CommandLine::errors() const -> std::vector<std::string> const& {
    return errors_;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void CommandLine::log_error(std::string_view message) {
    errors_.emplace_back(message);
    std::string text = program_name_.empty() ? std::string{"castrelay"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace CR::App
