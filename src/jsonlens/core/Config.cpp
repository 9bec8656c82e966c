#include "Config.hpp"
#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace JL {

namespace {

using Json = nlohmann::ordered_json;

auto configError(std::string_view section, std::string_view key, std::string_view expectation) -> Error {
    std::string message{section};
    message.push_back('.');
    message.append(key);
    message.append(" must be ");
    message.append(expectation);
    return Error{Error::Code::InvalidConfig, std::move(message)};
}

// Each reader leaves the target untouched when the key is absent.
template <typename T>
auto readUnsigned(Json const& section, std::string_view sectionName, char const* key, T& target) -> std::optional<Error> {
    auto it = section.find(key);
    if (it == section.end())
        return std::nullopt;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->template get<std::int64_t>() >= 0))
        return configError(sectionName, key, "a non-negative integer");
    target = static_cast<T>(it->template get<std::uint64_t>());
    return std::nullopt;
}

auto readMegabytes(Json const& section, std::string_view sectionName, char const* key, std::uint64_t& target) -> std::optional<Error> {
    std::uint64_t megabytes = target / MiB;
    if (auto error = readUnsigned(section, sectionName, key, megabytes))
        return error;
    target = megabytes * MiB;
    return std::nullopt;
}

auto readMillis(Json const& section, std::string_view sectionName, char const* key, std::chrono::milliseconds& target) -> std::optional<Error> {
    std::uint64_t millis = static_cast<std::uint64_t>(target.count());
    if (auto error = readUnsigned(section, sectionName, key, millis))
        return error;
    target = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(millis)};
    return std::nullopt;
}

auto readBool(Json const& section, std::string_view sectionName, char const* key, bool& target) -> std::optional<Error> {
    auto it = section.find(key);
    if (it == section.end())
        return std::nullopt;
    if (!it->is_boolean())
        return configError(sectionName, key, "a boolean");
    target = it->get<bool>();
    return std::nullopt;
}

auto sectionOf(Json const& root, char const* name) -> Json const* {
    auto it = root.find(name);
    if (it == root.end() || !it->is_object())
        return nullptr;
    return &*it;
}

template <typename T>
auto envUnsigned(char const* name, T& target) -> void {
    auto const* raw = std::getenv(name);
    if (raw == nullptr)
        return;
    std::string_view text{raw};
    std::uint64_t    value  = 0;
    auto const       result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        jl_log(std::string{"Ignoring malformed "} + name + "=" + std::string{text}, "Config", "Warning");
        return;
    }
    target = static_cast<T>(value);
}

} // namespace

auto validateConfig(Config const& config) -> std::optional<Error> {
    if (config.parse.maxDepth == 0)
        return configError("parse", "maxDepth", "greater than zero");
    if (config.loader.maxConcurrentLoads == 0)
        return configError("loader", "maxConcurrentLoads", "greater than zero");
    if (config.loader.batchSize == 0)
        return configError("loader", "batchSize", "greater than zero");
    if (config.loader.childLimit == 0)
        return configError("loader", "childLimit", "greater than zero");
    if (config.monitor.criticalBytes <= config.monitor.warningBytes)
        return configError("monitor", "criticalMB", "above monitor.warningMB");
    if (config.monitor.interval.count() <= 0)
        return configError("monitor", "intervalMs", "greater than zero");
    if (config.search.gramSize == 0)
        return configError("search", "gramSize", "greater than zero");
    if (config.backgroundThreads == 0)
        return configError("config", "backgroundThreads", "greater than zero");
    return std::nullopt;
}

auto configFromJson(Json const& json) -> Expected<Config> {
    if (!json.is_object())
        return std::unexpected(Error{Error::Code::InvalidConfig, "configuration root must be an object"});

    Config config;
    std::optional<Error> error;
    auto collect = [&error](std::optional<Error> result) {
        if (!error && result)
            error = std::move(result);
    };

    if (auto const* parse = sectionOf(json, "parse")) {
        collect(readUnsigned(*parse, "parse", "maxDepth", config.parse.maxDepth));
        collect(readMegabytes(*parse, "parse", "maxFileMB", config.parse.maxBytes));
        collect(readBool(*parse, "parse", "allowComments", config.parse.allowComments));
    }
    if (auto const* loader = sectionOf(json, "loader")) {
        collect(readUnsigned(*loader, "loader", "maxConcurrentLoads", config.loader.maxConcurrentLoads));
        collect(readUnsigned(*loader, "loader", "childLimit", config.loader.childLimit));
        collect(readUnsigned(*loader, "loader", "batchSize", config.loader.batchSize));
        collect(readMillis(*loader, "loader", "loadTimeoutMs", config.loader.loadTimeout));
        collect(readUnsigned(*loader, "loader", "previewLength", config.loader.previewLength));
        collect(readUnsigned(*loader, "loader", "preloadCount", config.loader.preloadCount));
        collect(readBool(*loader, "loader", "expandRootOnOpen", config.loader.expandRootOnOpen));
    }
    if (auto const* monitor = sectionOf(json, "monitor")) {
        collect(readBool(*monitor, "monitor", "autoStart", config.monitor.autoStart));
        collect(readMillis(*monitor, "monitor", "intervalMs", config.monitor.interval));
        collect(readMegabytes(*monitor, "monitor", "warningMB", config.monitor.warningBytes));
        collect(readMegabytes(*monitor, "monitor", "criticalMB", config.monitor.criticalBytes));
        collect(readUnsigned(*monitor, "monitor", "aggressiveAfter", config.monitor.aggressiveAfter));
        collect(readMillis(*monitor, "monitor", "aggressiveCooldownMs", config.monitor.aggressiveCooldown));
        collect(readMillis(*monitor, "monitor", "regularIdleGraceMs", config.monitor.regularIdleGrace));
        collect(readMillis(*monitor, "monitor", "cachePurgeIntervalMs", config.monitor.cachePurgeInterval));
        collect(readUnsigned(*monitor, "monitor", "cacheCapacity", config.monitor.cacheCapacity));
        collect(readUnsigned(*monitor, "monitor", "optimizeMinDepth", config.monitor.optimizeMinDepth));
    }
    if (auto const* search = sectionOf(json, "search")) {
        collect(readUnsigned(*search, "search", "maxResults", config.search.maxResults));
        collect(readMillis(*search, "search", "timeoutMs", config.search.timeout));
        collect(readUnsigned(*search, "search", "ngramThreshold", config.search.ngramThreshold));
        collect(readUnsigned(*search, "search", "gramSize", config.search.gramSize));
        collect(readUnsigned(*search, "search", "contextRadius", config.search.contextRadius));
        collect(readUnsigned(*search, "search", "minQueryLength", config.search.minQueryLength));
    }
    collect(readUnsigned(json, "config", "backgroundThreads", config.backgroundThreads));

    if (error)
        return std::unexpected(std::move(*error));
    if (auto invalid = validateConfig(config))
        return std::unexpected(std::move(*invalid));
    return config;
}

auto configToJson(Config const& config) -> Json {
    Json json;
    json["parse"]  = {{"maxDepth", config.parse.maxDepth},
                      {"maxFileMB", config.parse.maxBytes / MiB},
                      {"allowComments", config.parse.allowComments}};
    json["loader"] = {{"maxConcurrentLoads", config.loader.maxConcurrentLoads},
                      {"childLimit", config.loader.childLimit},
                      {"batchSize", config.loader.batchSize},
                      {"loadTimeoutMs", config.loader.loadTimeout.count()},
                      {"previewLength", config.loader.previewLength},
                      {"preloadCount", config.loader.preloadCount},
                      {"expandRootOnOpen", config.loader.expandRootOnOpen}};
    json["monitor"] = {{"autoStart", config.monitor.autoStart},
                       {"intervalMs", config.monitor.interval.count()},
                       {"warningMB", config.monitor.warningBytes / MiB},
                       {"criticalMB", config.monitor.criticalBytes / MiB},
                       {"aggressiveAfter", config.monitor.aggressiveAfter},
                       {"aggressiveCooldownMs", config.monitor.aggressiveCooldown.count()},
                       {"regularIdleGraceMs", config.monitor.regularIdleGrace.count()},
                       {"cachePurgeIntervalMs", config.monitor.cachePurgeInterval.count()},
                       {"cacheCapacity", config.monitor.cacheCapacity},
                       {"optimizeMinDepth", config.monitor.optimizeMinDepth}};
    json["search"] = {{"maxResults", config.search.maxResults},
                      {"timeoutMs", config.search.timeout.count()},
                      {"ngramThreshold", config.search.ngramThreshold},
                      {"gramSize", config.search.gramSize},
                      {"contextRadius", config.search.contextRadius},
                      {"minQueryLength", config.search.minQueryLength}};
    json["backgroundThreads"] = config.backgroundThreads;
    return json;
}

auto loadConfig(std::filesystem::path const& file) -> Expected<Config> {
    std::ifstream stream(file, std::ios::binary);
    if (!stream)
        return std::unexpected(Error{Error::Code::IoError, "cannot open config file " + file.string()});
    std::ostringstream buffer;
    buffer << stream.rdbuf();

    auto json = Json::parse(buffer.str(), nullptr, false, true);
    if (json.is_discarded())
        return std::unexpected(Error{Error::Code::InvalidConfig, "config file is not valid JSON: " + file.string()});
    jl_log("Loaded configuration from " + file.string(), "Config");
    return configFromJson(json);
}

auto applyEnvironment(Config& config) -> void {
    envUnsigned("JSONLENS_MAX_DEPTH", config.parse.maxDepth);
    envUnsigned("JSONLENS_CHILD_LIMIT", config.loader.childLimit);

    std::uint64_t megabytes = config.parse.maxBytes / MiB;
    envUnsigned("JSONLENS_MAX_FILE_MB", megabytes);
    config.parse.maxBytes = megabytes * MiB;

    megabytes = config.monitor.warningBytes / MiB;
    envUnsigned("JSONLENS_WARNING_MB", megabytes);
    config.monitor.warningBytes = megabytes * MiB;

    megabytes = config.monitor.criticalBytes / MiB;
    envUnsigned("JSONLENS_CRITICAL_MB", megabytes);
    config.monitor.criticalBytes = megabytes * MiB;

    std::uint64_t intervalMs = static_cast<std::uint64_t>(config.monitor.interval.count());
    envUnsigned("JSONLENS_MONITOR_INTERVAL_MS", intervalMs);
    config.monitor.interval = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(intervalMs)};
}

} // namespace JL
