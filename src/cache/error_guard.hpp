#pragma once
#include <string>
#include <vector>

namespace querycache {

// Recognizes answers produced by a failed upstream call so they are never
// served from the cache.
class ErrorGuard {
public:
    // `extra_markers` are matched case-insensitively as substrings, in
    // addition to the built-in signatures.
    explicit ErrorGuard(const std::vector<std::string>& extra_markers = {});

    bool is_failure(const std::string& answer) const { return !match(answer).empty(); }

    // Name of the first signature found in `answer`, empty if none.
    std::string match(const std::string& answer) const;

    // Placeholder answer ("Found 12 result(s)...") given to a chart, report
    // or graph question before its rendering step ran.
    static bool is_generic_answer(const std::string& question, const std::string& answer);

private:
    std::vector<std::string> markers_; // lowercase
};

} // namespace querycache
