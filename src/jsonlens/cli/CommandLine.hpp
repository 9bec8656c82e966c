#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace JL::CLI {

/**
 * CommandLine: small option parser for the jsonlens tool.
 *
 * Options are "--name", "--name value" or "--name=value". Tokens that do not
 * start with '-' are collected as positionals. Errors are reported through the
 * error logger (stderr by default) and recorded; parse() returns false if any
 * occurred but keeps going so that every problem is reported at once.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    auto setProgramName(std::string_view name) -> void;
    auto setErrorLogger(std::function<void(std::string const&)> logger) -> void;

    auto addFlag(std::string_view name, std::function<void()> onSet) -> void;
    auto addValue(std::string_view name, std::function<ParseError(std::string_view)> onValue) -> void;
    auto addSize(std::string_view name, std::function<void(std::size_t)> onValue) -> void;
    auto addAlias(std::string_view alias, std::string_view target) -> void;

    [[nodiscard]] auto parse(int argc, char const* const* argv) -> bool;
    [[nodiscard]] auto hadErrors() const -> bool { return this->hadError; }
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return this->positionals_; }
    [[nodiscard]] auto programName() const -> std::string const& { return this->programName_; }

private:
    struct Option {
        std::string                                  name;
        bool                                         expectsValue = false;
        std::function<void()>                        onFlag;
        std::function<ParseError(std::string_view)> onValue;
    };

    auto find(std::string_view name) -> Option*;
    auto add(Option option) -> void;
    auto fail(std::string_view message) -> void;

    std::vector<Option>                          options;
    std::unordered_map<std::string, std::size_t> lookup;
    std::vector<std::string>                     positionals_;
    std::string                                  programName_ = "jsonlens";
    std::function<void(std::string const&)>      errorLogger;
    bool                                         hadError = false;
};

} // namespace JL::CLI
