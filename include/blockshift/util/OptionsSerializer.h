#pragma once

#include "blockshift/move/config/MoveOptions.h"

#include <string>

namespace blockshift {

/// JSON serialization and file I/O for MoveOptions.
/// Keys missing from a document keep their default values.
class OptionsSerializer {
public:
    /// Serialize options to a JSON string
    static std::string toJson(const MoveOptions& options);

    /// Parse `json` into `options`
    /// @return true if parsing succeeded; `options` is untouched otherwise
    static bool fromJson(MoveOptions& options, const std::string& json);

    /// Save options to file
    /// @return true if save succeeded
    static bool saveToFile(const MoveOptions& options, const std::string& path);

    /// Load options from file
    /// @return true if load succeeded
    static bool loadFromFile(MoveOptions& options, const std::string& path);

    /// Parse a JSON document into options
    /// @throws std::runtime_error if the document is malformed or a value is out of range
    static MoveOptions optionsFromJson(const std::string& json);
};

}  // namespace blockshift
