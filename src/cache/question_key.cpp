#include "question_key.hpp"
#include "../util.hpp"

#ifdef QUERYCACHE_USE_COMMONCRYPTO
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/sha.h>
#endif
#include <cctype>

namespace querycache {

std::string normalize_question(const std::string& question) {
    std::string lowered = to_lower(question);

    // Collapse whitespace; leading and trailing runs disappear entirely.
    std::string out;
    out.reserve(lowered.size());
    bool pending_space = false;
    for (unsigned char c : lowered) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }

    // "customers ?" and "customers?" must collide, so a space exposed by
    // stripping punctuation goes too.
    while (!out.empty() && (out.back() == '?' || out.back() == '.' ||
                            out.back() == '!' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

std::string cache_key_normalized(const std::string& normalized, const std::string& model) {
    std::string material = normalized + "|" + model;
#ifdef QUERYCACHE_USE_COMMONCRYPTO
    unsigned char hash[CC_SHA256_DIGEST_LENGTH];
    CC_SHA256(material.data(), static_cast<CC_LONG>(material.size()), hash);
    return hex_encode(hash, CC_SHA256_DIGEST_LENGTH);
#else
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(material.data()), material.size(), hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
#endif
}

std::string cache_key(const std::string& question, const std::string& model) {
    return cache_key_normalized(normalize_question(question), model);
}

std::string short_key(const std::string& key) {
    return key.size() > 16 ? key.substr(0, 16) + "..." : key;
}

} // namespace querycache
