#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace CR::App {

// Small declarative argument parser. Options take "--name value" or "--name=value"; tokens
// that are not options go to the positional handler; "--" ends option parsing.
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void set_program_name(std::string_view name);
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    void add_flag(std::string_view name, std::function<void()> on_set);
    void add_value(std::string_view name, std::function<ParseError(std::string_view)> on_value);
    void add_int(std::string_view name, std::function<void(int)> on_value);
    void add_double(std::string_view name, std::function<void(double)> on_value);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto errors() const -> std::vector<std::string> const&;

private:
    struct OptionEntry {
        std::string                                    name;
        bool                                           expects_value = false;
        std::function<void()>                          flag_handler;
        std::function<ParseError(std::string_view)>    value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::function<ParseError(std::string_view)>  positional_handler_;
    std::function<void(std::string const&)>      error_logger_;
    std::vector<std::string>                     errors_;
};

} // namespace CR::App
