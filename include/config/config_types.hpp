#pragma once

#include <string>
#include <vector>

namespace shapesql {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";   // debug | info | warn | error
};

struct OutputConfig {
    std::string format = "sql";   // sql | json
    std::string schema;           // Optional schema qualifier for table names
    bool if_not_exists = false;
    std::string file;             // Empty = stdout
};

struct ShapesqlConfig {
    LoggingConfig logging;
    OutputConfig output;
    std::vector<std::string> shape_paths;   // [[shapes]] path = "..."
};

} // namespace shapesql
