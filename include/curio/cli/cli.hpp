#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace curio {
namespace cli {

// ============================================================================
// Option definitions
// ============================================================================

/**
 * @brief How an option's value is read and checked while parsing
 */
enum class OptionKind {
    Text,     ///< Any string
    Count,    ///< Non-negative integer
    Number,   ///< Floating point
    Switch    ///< No value; presence turns it on
};

struct OptionDef {
    std::string name;           ///< Long name, used as --name
    std::string short_name;     ///< Single letter, used as -x (may be empty)
    std::string description;
    OptionKind kind = OptionKind::Text;
    std::string default_value;
    bool required = false;
};

/**
 * @brief Bad command line: unknown option, stray word, missing or malformed value
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Parsed options
// ============================================================================

/**
 * @brief Option values of one command invocation
 *
 * Values were checked against their OptionKind during parsing, so the typed
 * accessors only convert.
 */
class Options {
public:
    void set(const std::string& name, std::string value);

    bool has(const std::string& name) const;
    std::string text(const std::string& name, const std::string& fallback = "") const;
    size_t count(const std::string& name, size_t fallback) const;
    double number(const std::string& name, double fallback) const;
    bool enabled(const std::string& name) const;

    /// Throws UsageError when the option was not given
    std::string require(const std::string& name) const;

private:
    std::map<std::string, std::string> values_;
};

// ============================================================================
// Commands
// ============================================================================

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionDef> options;
    std::function<int(const Options&)> handler;

    void print_usage(std::ostream& out, const std::string& program) const;
};

/**
 * @brief Subcommand dispatcher for the curio tool
 *
 * Every token after the command name must be an option of that command;
 * bare words are rejected.
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version);

    void add(Command command);
    const Command* find(const std::string& name) const;

    /// Parse the tokens that follow the command name
    Options parse(const Command& command, const std::vector<std::string>& tokens) const;

    /// Dispatch argv; returns the process exit code
    int run(int argc, char** argv) const;

    void print_help(std::ostream& out) const;

private:
    std::string program_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace cli
} // namespace curio
