#include "artifacts/integrity_verifier.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "utils/sha256.h"

namespace ardl {

const char* to_string(VerificationVerdict verdict) {
    switch (verdict) {
        case VerificationVerdict::Match:
            return "match";
        case VerificationVerdict::Mismatch:
            return "mismatch";
        case VerificationVerdict::Skipped:
            return "skipped";
        case VerificationVerdict::Unreadable:
            return "unreadable";
    }
    return "unknown";
}

IntegrityVerifier::IntegrityVerifier(size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 8192 : chunk_size) {}

std::string IntegrityVerifier::digest(const std::filesystem::path& path) const {
    return sha256_file(path, chunk_size_);
}

VerificationResult IntegrityVerifier::verify(const std::filesystem::path& path,
                                             const std::optional<std::string>& expected_sha256) const {
    VerificationResult result;
    if (!expected_sha256 || expected_sha256->empty()) {
        spdlog::info("IntegrityVerifier: no checksum declared for {}, skipping (no integrity evidence)",
                     path.filename().string());
        result.verdict = VerificationVerdict::Skipped;
        return result;
    }

    std::string expected = *expected_sha256;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    try {
        result.computed_hash = digest(path);
    } catch (const std::runtime_error& e) {
        result.verdict = VerificationVerdict::Unreadable;
        result.error = e.what();
        spdlog::warn("IntegrityVerifier: cannot hash {}: {}", path.string(), e.what());
        return result;
    }

    if (result.computed_hash == expected) {
        result.verdict = VerificationVerdict::Match;
        spdlog::debug("IntegrityVerifier: checksum verified for {}", path.filename().string());
    } else {
        result.verdict = VerificationVerdict::Mismatch;
        result.error = "checksum mismatch: expected " + expected + ", got " + result.computed_hash;
        spdlog::warn("IntegrityVerifier: {} for {}", result.error, path.filename().string());
    }
    return result;
}

}  // namespace ardl
