#include "curio/cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace curio {
namespace cli {

namespace {

void check_value(const OptionDef& def, const std::string& value) {
    switch (def.kind) {
        case OptionKind::Count: {
            bool digits = !value.empty() &&
                std::all_of(value.begin(), value.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!digits) {
                throw UsageError("--" + def.name + " expects a non-negative integer, got '" + value + "'");
            }
            try {
                (void)std::stoull(value);
            } catch (const std::out_of_range&) {
                throw UsageError("--" + def.name + " is out of range: " + value);
            }
            break;
        }
        case OptionKind::Number: {
            size_t consumed = 0;
            try {
                (void)std::stod(value, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value.size()) {
                throw UsageError("--" + def.name + " expects a number, got '" + value + "'");
            }
            break;
        }
        case OptionKind::Text:
        case OptionKind::Switch:
            break;
    }
}

const char* value_hint(OptionKind kind) {
    switch (kind) {
        case OptionKind::Count: return " <n>";
        case OptionKind::Number: return " <x>";
        case OptionKind::Text: return " <value>";
        case OptionKind::Switch: return "";
    }
    return "";
}

} // anonymous namespace

// ==========================================
// Options
// ==========================================

void Options::set(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

bool Options::has(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string Options::text(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    return it == values_.end() ? fallback : it->second;
}

size_t Options::count(const std::string& name, size_t fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    return static_cast<size_t>(std::stoull(it->second));
}

double Options::number(const std::string& name, double fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    return std::stod(it->second);
}

bool Options::enabled(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() && it->second == "true";
}

std::string Options::require(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw UsageError("Missing required option: --" + name);
    }
    return it->second;
}

// ==========================================
// Command
// ==========================================

void Command::print_usage(std::ostream& out, const std::string& program) const {
    out << "\nUsage: " << program << " " << name;
    for (const auto& opt : options) {
        if (opt.required) out << " --" << opt.name << value_hint(opt.kind);
    }
    out << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& opt : options) {
        out << "  --" << opt.name;
        if (!opt.short_name.empty()) out << ", -" << opt.short_name;
        out << value_hint(opt.kind) << "\n      " << opt.description;
        if (!opt.default_value.empty()) out << " (default: " << opt.default_value << ")";
        if (opt.required) out << " [required]";
        out << "\n";
    }
    out << "\n";
}

// ==========================================
// CommandLine
// ==========================================

CommandLine::CommandLine(std::string program, std::string version)
    : program_(std::move(program)), version_(std::move(version)) {}

void CommandLine::add(Command command) {
    std::string name = command.name;
    commands_[name] = std::move(command);
}

const Command* CommandLine::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

Options CommandLine::parse(const Command& command, const std::vector<std::string>& tokens) const {
    std::map<std::string, const OptionDef*> lookup;
    for (const auto& opt : command.options) {
        lookup["--" + opt.name] = &opt;
        if (!opt.short_name.empty()) lookup["-" + opt.short_name] = &opt;
    }

    Options options;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token.empty() || token[0] != '-') {
            throw UsageError("Unexpected argument '" + token + "' for " + command.name);
        }

        std::string key = token;
        std::string inline_value;
        bool has_inline = false;
        auto eq = token.find('=');
        if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
            key = token.substr(0, eq);
            inline_value = token.substr(eq + 1);
            has_inline = true;
        }

        auto it = lookup.find(key);
        if (it == lookup.end()) {
            throw UsageError("Unknown option " + key + " for " + command.name);
        }
        const OptionDef& def = *it->second;

        if (def.kind == OptionKind::Switch) {
            if (has_inline) {
                throw UsageError("--" + def.name + " takes no value");
            }
            options.set(def.name, "true");
            continue;
        }

        std::string value;
        if (has_inline) {
            value = inline_value;
        } else if (i + 1 < tokens.size()) {
            value = tokens[++i];
        } else {
            throw UsageError("--" + def.name + " requires a value");
        }
        check_value(def, value);
        options.set(def.name, value);
    }

    for (const auto& def : command.options) {
        if (options.has(def.name)) continue;
        if (def.required) {
            throw UsageError("Missing required option: --" + def.name);
        }
        if (!def.default_value.empty()) {
            check_value(def, def.default_value);
            options.set(def.name, def.default_value);
        }
    }
    return options;
}

int CommandLine::run(int argc, char** argv) const {
    if (argc < 2) {
        print_help(std::cerr);
        return 1;
    }

    std::string name = argv[1];
    if (name == "--help" || name == "-h") {
        print_help(std::cout);
        return 0;
    }
    if (name == "--version") {
        std::cout << program_ << " " << version_ << "\n";
        return 0;
    }

    const Command* command = find(name);
    if (!command) {
        std::cerr << "Unknown command: " << name << "\n"
                  << "Run '" << program_ << " --help' for available commands.\n";
        return 1;
    }

    std::vector<std::string> tokens(argv + 2, argv + argc);
    if (std::find_if(tokens.begin(), tokens.end(),
                     [](const std::string& t) { return t == "--help" || t == "-h"; }) != tokens.end()) {
        command->print_usage(std::cout, program_);
        return 0;
    }

    Options options;
    try {
        options = parse(*command, tokens);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        command->print_usage(std::cerr, program_);
        return 2;
    }

    try {
        return command->handler(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CommandLine::print_help(std::ostream& out) const {
    out << program_ << " - knowledge graph construction and similarity engine\n\n"
        << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
    for (const auto& [name, command] : commands_) {
        out << "  " << name << std::string(name.size() < 14 ? 14 - name.size() : 1, ' ')
            << command.description << "\n";
    }
    out << "\nRun '" << program_ << " <command> --help' for command options.\n";
}

} // namespace cli
} // namespace curio
