/**
 * ContextProvider.hpp - Candidate lists for filesystem, VCS, package and process completions
 */

#pragma once

#include "hint/Suggestion.hpp"

#include <string>
#include <vector>

namespace hint {

struct ContextCandidate {
    std::string value;
    std::string description;
};

class ContextProvider {
public:
    virtual ~ContextProvider() = default;

    virtual std::vector<ContextCandidate> candidates(ContextKind kind,
                                                     const std::string& prefix,
                                                     const std::string& directory) = 0;
};

// Lists directory entries for ContextKind::FILE; other kinds yield nothing
class FilesystemContextProvider : public ContextProvider {
public:
    explicit FilesystemContextProvider(size_t max_entries = 20);

    std::vector<ContextCandidate> candidates(ContextKind kind,
                                             const std::string& prefix,
                                             const std::string& directory) override;

private:
    size_t max_entries_;
};

} // namespace hint
