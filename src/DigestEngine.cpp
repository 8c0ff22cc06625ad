#include "DigestEngine.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace {
struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

const EVP_MD* messageDigestFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
    case DigestAlgorithm::SHA1:
        return EVP_sha1();
    case DigestAlgorithm::SHA224:
        return EVP_sha224();
    case DigestAlgorithm::SHA256:
        return EVP_sha256();
    case DigestAlgorithm::MD5:
        break;
    }
    return EVP_md5();
}

std::string toHex(const unsigned char* data, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}
} // namespace

DigestAlgorithm digestAlgorithmFromName(const std::string& name) {
    if (name == "MD5") {
        return DigestAlgorithm::MD5;
    }
    if (name == "SHA-1") {
        return DigestAlgorithm::SHA1;
    }
    if (name == "SHA-224") {
        return DigestAlgorithm::SHA224;
    }
    if (name == "SHA-256") {
        return DigestAlgorithm::SHA256;
    }

    std::cerr << "Unknown hash method `" << name << "`, falling back to MD5." << std::endl;
    return DigestAlgorithm::MD5;
}

const char* digestAlgorithmName(DigestAlgorithm algorithm) {
    switch (algorithm) {
    case DigestAlgorithm::MD5:
        return "MD5";
    case DigestAlgorithm::SHA1:
        return "SHA-1";
    case DigestAlgorithm::SHA224:
        return "SHA-224";
    case DigestAlgorithm::SHA256:
        return "SHA-256";
    }
    return "MD5";
}

bool DigestEngine::compute(const std::filesystem::path& filePath, DigestAlgorithm algorithm, std::string& hexDigest) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open `" << filePath.string() << "` for hashing." << std::endl;
        return false;
    }

    // A fresh context per file so no state carries over between digests.
    MdContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), messageDigestFor(algorithm), nullptr) != 1) {
        std::cerr << "Failed to initialise " << digestAlgorithmName(algorithm) << " digest." << std::endl;
        return false;
    }

    std::array<char, kChunkSize> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            std::cerr << "Digest update failed for `" << filePath.string() << "`." << std::endl;
            return false;
        }
    }

    if (file.bad()) {
        std::cerr << "Read error while hashing `" << filePath.string() << "`." << std::endl;
        return false;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1) {
        std::cerr << "Failed to finalise digest for `" << filePath.string() << "`." << std::endl;
        return false;
    }

    hexDigest = toHex(digest.data(), digestLength);
    return true;
}
