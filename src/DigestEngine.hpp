#ifndef DIGEST_ENGINE_HPP
#define DIGEST_ENGINE_HPP

#include <cstddef>
#include <filesystem>
#include <string>

enum class DigestAlgorithm {
    MD5,
    SHA1,
    SHA224,
    SHA256
};

// Map a hashMethod setting (MD5, SHA-1, SHA-224, SHA-256) to an algorithm.
// Unknown names fall back to MD5 with a warning instead of failing.
DigestAlgorithm digestAlgorithmFromName(const std::string& name);
// Canonical setting name for an algorithm.
const char* digestAlgorithmName(DigestAlgorithm algorithm);

// Computes file content digests with OpenSSL, streaming the file in fixed-size chunks.
class DigestEngine {
public:
    static constexpr std::size_t kChunkSize = 4096;

    // Hash the file at filePath into lowercase hex; returns false if it cannot be opened or read.
    bool compute(const std::filesystem::path& filePath, DigestAlgorithm algorithm, std::string& hexDigest) const;
};

#endif
