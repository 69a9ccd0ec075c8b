/**
 * OfflineCatalog.hpp - Static command, flag and explanation tables for offline mode
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace hint {

using CatalogEntry = std::pair<std::string, std::string>;   // name, description

// Known commands in table order; doubles as the fuzzy-match vocabulary
const std::vector<CatalogEntry>& basicCommands();

// Flags for a base command in table order; empty when the command has no table
const std::vector<CatalogEntry>& flagsFor(const std::string& base_command);

// One-line explanation keyed by base command name
std::string offlineExplanation(const std::string& command_name);

// Commands whose online explanation is requested in structured (JSON) form
bool prefersStructuredExplanation(const std::string& base_command);

} // namespace hint
