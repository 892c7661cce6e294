// =============================================================================
// datefmt - Command Line Argument Parser
// Version: 1.2.0
// =============================================================================

#pragma once

#include "datefmt/common/types.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>
#include <map>

namespace datefmt::cli {

/**
 * @brief Command-line argument parser
 *
 * Supports:
 * - Long options (--name, --name=value)
 * - Short options (-n, -n value, -nvalue)
 * - Boolean flags
 * - Positional arguments, the first usually a sub-command
 * - Help generation
 */
class ArgParser {
public:
    struct Option {
        String long_name;
        char short_name = 0;
        String description;
        String default_value;
        bool is_flag = false;
        bool required = false;
    };

    explicit ArgParser(String program_name = "", String description = "")
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    ArgParser& add_option(const String& long_name,
                          char short_name = 0,
                          const String& description = "",
                          const String& default_value = "",
                          bool required = false) {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.default_value = default_value;
        opt.required = required;
        options_.push_back(std::move(opt));
        return *this;
    }

    ArgParser& add_flag(const String& long_name,
                        char short_name = 0,
                        const String& description = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.is_flag = true;
        options_.push_back(std::move(opt));
        return *this;
    }

    ArgParser& add_positional(const String& name,
                              const String& description = "",
                              bool required = true) {
        positionals_.push_back({name, description, required});
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return false on error or when help was requested (help_requested())
     */
    bool parse(int argc, char* argv[]) {
        if (argc > 0 && program_name_.empty()) program_name_ = argv[0];

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) values_[opt.long_name] = opt.default_value;
            if (opt.is_flag) flags_[opt.long_name] = false;
        }

        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            String arg = argv[i];

            if (!options_done && (arg == "-h" || arg == "--help")) {
                help_requested_ = true;
                return false;
            }

            if (!options_done && arg == "--") {
                options_done = true;
            } else if (!options_done && arg.starts_with("--")) {
                String name;
                Optional<String> value;
                auto eq_pos = arg.find('=');
                if (eq_pos != String::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                } else {
                    name = arg.substr(2);
                }

                const Option* opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return false;
                }
                if (opt->is_flag) {
                    flags_[opt->long_name] = true;
                    continue;
                }
                if (!value) {
                    if (i + 1 >= argc) {
                        error_ = "Option --" + name + " requires a value";
                        return false;
                    }
                    value = argv[++i];
                }
                values_[opt->long_name] = *value;
            } else if (!options_done && arg.size() > 1 && arg[0] == '-' && !is_digit(arg[1])) {
                // Short option cluster; a leading digit marks a negative number
                for (Size j = 1; j < arg.size(); ++j) {
                    char c = arg[j];
                    const Option* opt = find_option(c);
                    if (!opt) {
                        error_ = String("Unknown option: -") + c;
                        return false;
                    }
                    if (opt->is_flag) {
                        flags_[opt->long_name] = true;
                        continue;
                    }
                    String value;
                    if (j + 1 < arg.size()) {
                        value = arg.substr(j + 1);
                    } else if (i + 1 < argc) {
                        value = argv[++i];
                    } else {
                        error_ = String("Option -") + c + " requires a value";
                        return false;
                    }
                    values_[opt->long_name] = value;
                    break;
                }
            } else if (positional_values_.size() < positionals_.size()) {
                positional_values_.push_back(arg);
            } else {
                extra_args_.push_back(arg);
            }
        }

        for (const auto& opt : options_) {
            if (opt.required && values_.find(opt.long_name) == values_.end()) {
                error_ = "Required option missing: --" + opt.long_name;
                return false;
            }
        }
        for (Size i = 0; i < positionals_.size(); ++i) {
            if (positionals_[i].required && i >= positional_values_.size()) {
                error_ = "Required argument missing: " + positionals_[i].name;
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] Optional<String> get(const String& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) return it->second;
        return nullopt;
    }

    [[nodiscard]] String get(const String& name, const String& default_val) const {
        return get(name).value_or(default_val);
    }

    // nullopt when absent, not an integer or outside T's range
    template<Integral T = Int64>
    [[nodiscard]] Optional<T> get_int(const String& name) const {
        auto str = get(name);
        if (!str || str->empty()) return nullopt;
        T value = 0;
        const char* end = str->data() + str->size();
        auto [ptr, ec] = std::from_chars(str->data(), end, value);
        if (ec != std::errc() || ptr != end) return nullopt;
        return value;
    }

    [[nodiscard]] bool has(const String& name) const { return values_.find(name) != values_.end(); }

    [[nodiscard]] bool flag(const String& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    [[nodiscard]] Optional<String> positional(Size index) const {
        if (index < positional_values_.size()) return positional_values_[index];
        return nullopt;
    }

    [[nodiscard]] const Vector<String>& positional_args() const { return positional_values_; }
    [[nodiscard]] const Vector<String>& extra_args() const { return extra_args_; }
    [[nodiscard]] const String& error() const { return error_; }
    [[nodiscard]] bool help_requested() const { return help_requested_; }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_;
        for (const auto& p : positionals_) {
            out << (p.required ? " <" : " [") << p.name << (p.required ? ">" : "]");
        }
        if (!options_.empty()) out << " [options]";
        out << "\n\n";

        if (!description_.empty()) out << description_ << "\n\n";

        if (!positionals_.empty()) {
            out << "Arguments:\n";
            for (const auto& p : positionals_) {
                out << "  " << std::left << std::setw(24) << p.name << p.description << "\n";
            }
            out << "\n";
        }

        if (!options_.empty()) {
            out << "Options:\n";
            for (const auto& opt : options_) {
                out << "  ";
                if (opt.short_name) out << "-" << opt.short_name << ", ";
                else out << "    ";
                out << "--" << std::left << std::setw(18) << opt.long_name << opt.description;
                if (!opt.default_value.empty()) out << " [default: " << opt.default_value << "]";
                if (opt.required) out << " (required)";
                out << "\n";
            }
        }
        out << "  -h, --help                Show this help message\n";
    }

private:
    struct Positional {
        String name;
        String description;
        bool required = true;
    };

    [[nodiscard]] const Option* find_option(const String& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    [[nodiscard]] const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    String program_name_;
    String description_;
    Vector<Option> options_;
    Vector<Positional> positionals_;

    std::map<String, String> values_;
    std::map<String, bool> flags_;
    Vector<String> positional_values_;
    Vector<String> extra_args_;
    String error_;
    bool help_requested_ = false;
};

} // namespace datefmt::cli
