#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ormcost {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

struct CorrelatorConfig {
    // Path-component prefixes: a frame is internal when its file path starts
    // with one of these or has it right after a path separator ("orm/" matches
    // "/build/app/orm/queryset.cpp" but not "app/storm/handler.cpp").
    // Internal frames are skipped when resolving a query's origin.
    std::vector<std::string> internal_prefixes;
};

struct CaptureConfig {
    bool record_parameters = false;
    size_t max_statement_length = 0;        // 0 = keep full text
    size_t max_events_per_unit = 10000;
};

struct TrackerConfig {
    bool retain_read_counts = true;
};

struct EngineConfig {
    LoggingConfig logging;
    CorrelatorConfig correlator;
    CaptureConfig capture;
    TrackerConfig tracker;
};

} // namespace ormcost
