#include "chunkvault/core/cli.hpp"
#include <iostream>
#include <iomanip>

namespace chunkvault::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "chunkvault.conf");
    add_option("", "verbose", "Enable verbose logging");
    add_option("p", "priority", "Job priority: low, normal, high, urgent", true, "normal");
    add_option("", "no-reassemble", "Upload chunks only, reassemble later");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    auto key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{key, description, has_value, default_value};

    if (!short_name.empty()) {
        short_to_long_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg.starts_with("--")) {
            if (!parse_long_option(arg, argc, argv, i)) {
                return false;
            }
        } else if (!parse_short_options(arg, argc, argv, i)) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long_option(const std::string& arg, int argc, char* argv[], int& index) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!it->second.has_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " takes no value";
            return false;
        }
        parsed_options_[name] = "true";
        return true;
    }

    if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse_short_options(const std::string& arg, int argc, char* argv[], int& index) {
    // Short flags may be grouped (-hv); a valued flag takes the rest of the group or the next argument
    for (size_t j = 1; j < arg.length(); ++j) {
        std::string short_name(1, arg[j]);

        auto long_it = short_to_long_.find(short_name);
        if (long_it == short_to_long_.end()) {
            error_ = "Unknown option: -" + short_name;
            return false;
        }

        const auto& name = long_it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }

        if (j + 1 < arg.length()) {
            parsed_options_[name] = arg.substr(j + 1);
        } else if (index + 1 < argc) {
            parsed_options_[name] = argv[++index];
        } else {
            error_ = "Option -" + short_name + " requires a value";
            return false;
        }
        break;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto normalized = normalize_option_name(name);

    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }

    return default_value;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string short_opt = "    ";
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                short_opt = "-" + short_name + ", ";
                break;
            }
        }

        std::cout << "  " << std::left << std::setw(28)
                  << (short_opt + "--" + name + (option.has_value ? " <value>" : ""))
                  << option.description;

        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

} // namespace chunkvault::core
