#pragma once
#include <string>

namespace querycache {

// Canonical form of a question: lowercased, trimmed, internal whitespace
// runs collapsed to one space, trailing '?', '.' and '!' stripped.
std::string normalize_question(const std::string& question);

// SHA-256 of "<normalized question>|<model>" as 64 lowercase hex characters.
std::string cache_key(const std::string& question, const std::string& model);

// Same, for a question that is already normalized.
std::string cache_key_normalized(const std::string& normalized, const std::string& model);

// First 16 characters of a key, for log lines.
std::string short_key(const std::string& key);

} // namespace querycache
