#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace ardl {

enum class VerificationVerdict {
    Match,
    Mismatch,
    Skipped,     // no expected checksum: no integrity evidence available
    Unreadable,
};

const char* to_string(VerificationVerdict verdict);

struct VerificationResult {
    VerificationVerdict verdict{VerificationVerdict::Skipped};
    std::string computed_hash;  // empty when skipped or unreadable
    std::string error;

    // Publication may proceed (match, or an explicit skip).
    bool acceptable() const {
        return verdict == VerificationVerdict::Match || verdict == VerificationVerdict::Skipped;
    }
};

class IntegrityVerifier {
public:
    explicit IntegrityVerifier(size_t chunk_size = 64 * 1024);

    // Lowercase hex SHA-256 of the file, read in chunk_size pieces.
    // Throws std::runtime_error when the file cannot be read.
    std::string digest(const std::filesystem::path& path) const;

    // Compare the file digest with expected_sha256 (case-insensitive).
    // Never throws; read failures come back as Unreadable.
    VerificationResult verify(const std::filesystem::path& path,
                              const std::optional<std::string>& expected_sha256) const;

    size_t chunkSize() const { return chunk_size_; }

private:
    size_t chunk_size_;
};

}  // namespace ardl
