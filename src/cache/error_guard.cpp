#include "error_guard.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace querycache {

namespace {

const std::vector<std::string>& builtin_markers() {
    static const std::vector<std::string> markers = {
        "error code:",
        "api error",
        "traceback (most recent call last)",
        "rate limit exceeded",
        "insufficient credits",
        "payment required",
        "too many requests",
        "internal server error",
        "service unavailable",
        "bad gateway",
        "gateway timeout",
    };
    return markers;
}

// Words that make an adjacent 4xx/5xx number read as a status code.
const std::vector<std::string>& status_words_before() {
    static const std::vector<std::string> words = {"http", "status", "code", "error"};
    return words;
}

const std::vector<std::string>& status_words_after() {
    static const std::vector<std::string> words = {
        "error", "client", "server", "not", "payment", "too",
        "unauthorized", "forbidden", "bad", "internal", "service", "gateway",
    };
    return words;
}

bool contains_word(const std::vector<std::string>& words, const std::string& w) {
    return std::find(words.begin(), words.end(), w) != words.end();
}

std::string strip_punct(const std::string& word) {
    size_t start = 0;
    size_t end = word.size();
    while (start < end && std::ispunct(static_cast<unsigned char>(word[start]))) ++start;
    while (end > start && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
    return word.substr(start, end - start);
}

bool is_failure_status(const std::string& word) {
    if (word.size() != 3) return false;
    for (char c : word) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    int code = std::stoi(word);
    return code >= 400 && code <= 599;
}

// "error", "error:", "error processing ..." but not "errors" or "erroneous"
bool leads_with_error(const std::string& lowered) {
    if (!starts_with(lowered, "error")) return false;
    return lowered.size() == 5 || !std::isalpha(static_cast<unsigned char>(lowered[5]));
}

bool has_status_code(const std::string& lowered) {
    std::vector<std::string> words;
    std::istringstream stream(lowered);
    std::string raw;
    while (stream >> raw) {
        words.push_back(strip_punct(raw));
    }
    for (size_t i = 0; i < words.size(); i++) {
        if (!is_failure_status(words[i])) continue;
        if (i > 0 && contains_word(status_words_before(), words[i - 1])) return true;
        if (i + 1 < words.size() && contains_word(status_words_after(), words[i + 1])) return true;
    }
    return false;
}

// `text` starts with `prefix`, then digits, then " result".
bool counted_result_phrase(const std::string& text, const std::string& prefix) {
    if (!starts_with(text, prefix)) return false;
    size_t i = prefix.size();
    size_t digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++digits;
    }
    return digits > 0 && text.compare(i, 7, " result") == 0;
}

} // namespace

ErrorGuard::ErrorGuard(const std::vector<std::string>& extra_markers) {
    for (const auto& m : builtin_markers()) markers_.push_back(m);
    for (const auto& m : extra_markers) {
        std::string lowered = to_lower(trim(m));
        if (!lowered.empty()) markers_.push_back(lowered);
    }
}

std::string ErrorGuard::match(const std::string& answer) const {
    std::string lowered = to_lower(trim(answer));
    if (lowered.empty()) return {};

    if (leads_with_error(lowered)) return "leading error";

    for (const auto& marker : markers_) {
        if (lowered.find(marker) != std::string::npos) return marker;
    }

    if (has_status_code(lowered)) return "http status code";
    return {};
}

bool ErrorGuard::is_generic_answer(const std::string& question, const std::string& answer) {
    std::string q = to_lower(question);
    bool rendered = q.find("chart") != std::string::npos ||
                    q.find("report") != std::string::npos ||
                    q.find("graph") != std::string::npos;
    if (!rendered) return false;

    std::string a = trim(answer);
    return counted_result_phrase(a, "Found ") || counted_result_phrase(a, "Query returned ");
}

} // namespace querycache
