#include "CommandLine.hpp"

#include <charconv>
#include <iostream>

namespace JL::CLI {

CommandLine::CommandLine() = default;

auto CommandLine::setProgramName(std::string_view name) -> void {
    this->programName_.assign(name.begin(), name.end());
}

auto CommandLine::setErrorLogger(std::function<void(std::string const&)> logger) -> void {
    this->errorLogger = std::move(logger);
}

auto CommandLine::addFlag(std::string_view name, std::function<void()> onSet) -> void {
    Option option;
    option.name.assign(name.begin(), name.end());
    option.onFlag = std::move(onSet);
    this->add(std::move(option));
}

auto CommandLine::addValue(std::string_view name, std::function<ParseError(std::string_view)> onValue) -> void {
    Option option;
    option.name.assign(name.begin(), name.end());
    option.expectsValue = true;
    option.onValue      = std::move(onValue);
    this->add(std::move(option));
}

auto CommandLine::addSize(std::string_view name, std::function<void(std::size_t)> onValue) -> void {
    this->addValue(name, [stored = std::string(name), handler = std::move(onValue)](std::string_view token) -> ParseError {
        if (token.empty())
            return stored + " requires a numeric value";
        std::size_t value = 0;
        auto        result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size())
            return stored + " expects a non-negative integer, got '" + std::string(token) + "'";
        handler(value);
        return std::nullopt;
    });
}

auto CommandLine::addAlias(std::string_view alias, std::string_view target) -> void {
    auto it = this->lookup.find(std::string(target));
    if (it == this->lookup.end()) {
        this->fail("missing option for alias '" + std::string(alias) + "'");
        return;
    }
    this->lookup.emplace(std::string(alias), it->second);
}

auto CommandLine::parse(int argc, char const* const* argv) -> bool {
    this->hadError = false;
    this->positionals_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view                token{argv[i]};
        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos && token.starts_with("--")) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        if (token.size() < 2 || token.front() != '-') {
            this->positionals_.emplace_back(token);
            continue;
        }

        Option* option = this->find(name);
        if (option == nullptr) {
            this->fail("unknown argument '" + std::string(token) + "'");
            continue;
        }

        if (!option->expectsValue) {
            if (attached) {
                this->fail(option->name + " does not accept a value");
                continue;
            }
            if (option->onFlag)
                option->onFlag();
            continue;
        }

        std::string_view value;
        if (attached) {
            value = *attached;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            this->fail(option->name + " requires a value");
            continue;
        }
        if (option->onValue) {
            if (auto error = option->onValue(value))
                this->fail(*error);
        }
    }
    return !this->hadError;
}

auto CommandLine::find(std::string_view name) -> Option* {
    auto it = this->lookup.find(std::string(name));
    if (it == this->lookup.end())
        return nullptr;
    return &this->options[it->second];
}

auto CommandLine::add(Option option) -> void {
    this->options.push_back(std::move(option));
    this->lookup.emplace(this->options.back().name, this->options.size() - 1);
}

auto CommandLine::fail(std::string_view message) -> void {
    this->hadError = true;
    std::string text = this->programName_ + ": " + std::string(message);
    if (this->errorLogger)
        this->errorLogger(text);
    else
        std::cerr << text << '\n';
}

} // namespace JL::CLI
