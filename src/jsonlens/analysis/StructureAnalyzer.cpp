#include "StructureAnalyzer.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <sstream>

namespace JL {

namespace {

constexpr std::uint64_t CancellationCheckInterval = 4096;

class Walker {
public:
    explicit Walker(CancellationToken const& token)
        : token(token) {}

    auto visit(Json const& element, std::uint64_t depth) -> void {
        if (this->stopped)
            return;
        if ((++this->info.totalNodes % CancellationCheckInterval) == 0) {
            if (auto error = this->token.check()) {
                this->stopped = std::move(error);
                return;
            }
        }
        this->info.maxDepth = std::max(this->info.maxDepth, depth);

        switch (kindOf(element)) {
        case NodeKind::Object:
            ++this->info.objectCount;
            this->info.propertyCount += element.size();
            for (auto const& [key, value] : element.items())
                this->visit(value, depth + 1);
            break;
        case NodeKind::Array:
            ++this->info.arrayCount;
            this->info.arrayItemCount += element.size();
            this->info.maxArrayLength = std::max<std::uint64_t>(this->info.maxArrayLength, element.size());
            for (auto const& value : element)
                this->visit(value, depth + 1);
            break;
        case NodeKind::String: {
            ++this->info.stringCount;
            auto const length = element.get_ref<Json::string_t const&>().size();
            this->info.totalStringLength += length;
            this->info.maxStringLength = std::max<std::uint64_t>(this->info.maxStringLength, length);
            break;
        }
        case NodeKind::Number:
            ++this->info.numberCount;
            break;
        case NodeKind::Boolean:
            ++this->info.booleanCount;
            break;
        case NodeKind::Null:
            ++this->info.nullCount;
            break;
        }
    }

    CancellationToken const& token;
    StructureInfo            info;
    std::optional<Error>     stopped;
};

} // namespace

auto StructureInfo::summary() const -> std::string {
    std::ostringstream oss;
    oss << "nodes: " << this->totalNodes
        << ", objects: " << this->objectCount
        << ", arrays: " << this->arrayCount
        << ", strings: " << this->stringCount
        << ", numbers: " << this->numberCount
        << ", booleans: " << this->booleanCount
        << ", nulls: " << this->nullCount
        << ", max depth: " << this->maxDepth
        << ", size: " << this->byteSize << " bytes";
    return oss.str();
}

auto analyze(Document const& document, CancellationToken const& token) -> Expected<StructureInfo> {
    if (auto error = token.check())
        return std::unexpected(std::move(*error));

    jl_log("analyze start: " + document.sourceName(), "Analyzer");
    Walker walker{token};
    walker.visit(document.root(), 0);
    if (walker.stopped) {
        jl_log("analyze stopped: " + describeError(*walker.stopped), "Analyzer");
        return std::unexpected(std::move(*walker.stopped));
    }
    walker.info.byteSize = document.byteSize();
    jl_log("analyze done: " + walker.info.summary(), "Analyzer");
    return walker.info;
}

} // namespace JL
