#pragma once
#include "Session.hpp"
#include "analysis/StructureAnalyzer.hpp"
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "document/Document.hpp"
#include "document/NodeKind.hpp"
#include "events/EventChannel.hpp"
#include "load/LoadCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "memory/MemoryMonitor.hpp"
#include "path/Path.hpp"
#include "search/SearchEngine.hpp"
#include "tree/LazyNode.hpp"
#include "tree/TreeMaterializer.hpp"
#include "tree/TreeSerializer.hpp"
