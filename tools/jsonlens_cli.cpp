#include "jsonlens/JsonLens.hpp"
#include "cli/CommandLine.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct CliOptions {
    std::optional<std::filesystem::path> file;
    std::optional<std::filesystem::path> configFile;
    std::optional<std::filesystem::path> savePath;
    std::optional<std::string>           listPath;
    std::optional<std::string>           query;
    std::size_t                          offset = 0;
    std::optional<std::size_t>           limit;
    std::size_t                          depth = 1;
    std::optional<std::size_t>           maxResults;
    bool                                 stats         = false;
    bool                                 regex         = false;
    bool                                 wildcard      = false;
    bool                                 caseSensitive = false;
    bool                                 paths         = false;
    bool                                 help          = false;
};

void print_usage() {
    std::cout << "Usage: jsonlens [options] <file.json>\n"
                 "Options:\n"
                 "  --stats                Print structure statistics\n"
                 "  --list <path>          List the children of the element at path (e.g. $.users[3])\n"
                 "  --offset <n>           First child listed by --list (default 0)\n"
                 "  --limit <n>            Maximum children listed or expanded per node\n"
                 "  --depth <n>            Levels expanded before indexing or saving (default 1)\n"
                 "  --search <text>        Search keys and values of the expanded tree\n"
                 "  --regex                Treat the search text as a regular expression\n"
                 "  --wildcard             Treat the search text as a glob pattern\n"
                 "  --case-sensitive       Match case exactly\n"
                 "  --paths                Also match against node paths\n"
                 "  --max-results <n>      Cap the number of search results\n"
                 "  --config <file>        Read settings from a JSON config file\n"
                 "  --save <file>          Write the expanded tree back out as JSON\n"
                 "  --help                 Show this message\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<CliOptions> {
    using JL::CLI::CommandLine;
    CliOptions options;

    CommandLine cli;
    cli.setProgramName("jsonlens");
    auto text = [](std::string_view name, auto& target) {
        return [name, &target](std::string_view value) -> CommandLine::ParseError {
            if (value.empty())
                return std::string{name} + " requires a value";
            target = std::string{value};
            return std::nullopt;
        };
    };
    cli.addValue("--list", text("--list", options.listPath));
    cli.addValue("--search", text("--search", options.query));
    cli.addValue("--config", text("--config", options.configFile));
    cli.addValue("--save", text("--save", options.savePath));
    cli.addSize("--offset", [&](std::size_t value) { options.offset = value; });
    cli.addSize("--limit", [&](std::size_t value) { options.limit = value; });
    cli.addSize("--depth", [&](std::size_t value) { options.depth = value; });
    cli.addSize("--max-results", [&](std::size_t value) { options.maxResults = value; });
    cli.addFlag("--stats", [&] { options.stats = true; });
    cli.addFlag("--regex", [&] { options.regex = true; });
    cli.addFlag("--wildcard", [&] { options.wildcard = true; });
    cli.addFlag("--case-sensitive", [&] { options.caseSensitive = true; });
    cli.addFlag("--paths", [&] { options.paths = true; });
    cli.addFlag("--help", [&] { options.help = true; });
    cli.addAlias("-h", "--help");

    if (!cli.parse(argc, argv))
        return std::nullopt;
    if (options.help)
        return options;
    if (cli.positionals().size() != 1) {
        std::cerr << "jsonlens: expected exactly one input file\n";
        return std::nullopt;
    }
    options.file = cli.positionals().front();
    return options;
}

auto load_config(CliOptions const& options) -> JL::Expected<JL::Config> {
    JL::Config config;
    if (options.configFile) {
        auto loaded = JL::loadConfig(*options.configFile);
        if (!loaded)
            return std::unexpected(std::move(loaded.error()));
        config = std::move(*loaded);
    }
    JL::applyEnvironment(config);
    // A one-shot run has nothing to monitor.
    config.monitor.autoStart = false;
    if (options.limit)
        config.loader.childLimit = *options.limit;
    return config;
}

auto report(JL::Error const& error) -> int {
    std::cerr << "jsonlens: " << JL::describeError(error) << "\n";
    return EXIT_FAILURE;
}

// Breadth-first expansion of the first `depth` levels.
auto expand_levels(JL::Session& session, std::size_t depth) -> std::optional<JL::Error> {
    std::deque<std::shared_ptr<JL::LazyNode>> pending{session.root()};
    while (!pending.empty()) {
        auto node = pending.front();
        pending.pop_front();
        if (node->path().depth() >= depth || !node->isExpandable())
            continue;
        auto outcome = session.expandAndWait(node);
        if (!outcome)
            return outcome.error();
        for (auto const& child : outcome->children)
            pending.push_back(child);
    }
    return std::nullopt;
}

auto list_children(JL::Session& session, CliOptions const& options) -> int {
    auto path = JL::Path::parse(*options.listPath);
    if (!path)
        return report(path.error());

    JL::MaterializeOptions materialize;
    materialize.offset        = options.offset;
    materialize.limit         = session.config().loader.childLimit;
    materialize.batchSize     = session.config().loader.batchSize;
    materialize.previewLength = session.config().loader.previewLength;
    auto listed = JL::materializeChildren(session.document(), *path, materialize);
    if (!listed)
        return report(listed.error());

    for (auto const& child : listed->children) {
        std::cout << child->path().toString() << "\t" << JL::kindToString(child->kind()) << "\t" << child->displayValue() << "\n";
    }
    std::cout << "(" << listed->children.size() << " of " << listed->totalCount << " children";
    if (listed->partial)
        std::cout << ", more available from offset " << listed->offset + listed->children.size();
    std::cout << ")\n";
    return EXIT_SUCCESS;
}

auto run_search(JL::Session& session, CliOptions const& options) -> int {
    if (auto indexed = session.rebuildIndex(); !indexed)
        return report(indexed.error());

    JL::SearchOptions search;
    search.regex         = options.regex;
    search.wildcard      = options.wildcard;
    search.caseSensitive = options.caseSensitive;
    search.paths         = options.paths;
    search.maxResults    = options.maxResults;
    auto results = session.search(*options.query, search).get();
    if (!results)
        return report(results.error());

    for (auto const& result : *results) {
        std::cout << result.pathText << "\t" << JL::matchKindToString(result.kind) << "\t" << result.score << "\t" << result.context << "\n";
    }
    std::cout << "(" << results->size() << " results)\n";
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
#ifdef JL_LOG_DEBUG
    JL::set_thread_name("Main");
    JL::configure_logging_from_environment();
#endif

    auto options = parse_cli(argc, argv);
    if (!options) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (options->help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    auto config = load_config(*options);
    if (!config)
        return report(config.error());

    auto session = JL::Session::open(*options->file, std::move(*config));
    if (!session)
        return report(session.error());

    int status = EXIT_SUCCESS;
    if (options->stats) {
        auto info = (*session)->analyze();
        if (!info)
            return report(info.error());
        std::cout << info->summary() << "\n";
    }
    if (options->listPath) {
        status = list_children(**session, *options);
        if (status != EXIT_SUCCESS)
            return status;
    }
    if (options->query || options->savePath) {
        if (auto error = expand_levels(**session, options->depth))
            return report(*error);
    }
    if (options->query) {
        status = run_search(**session, *options);
        if (status != EXIT_SUCCESS)
            return status;
    }
    if (options->savePath) {
        if (auto error = (*session)->save(*options->savePath))
            return report(*error);
    }
    return status;
}
