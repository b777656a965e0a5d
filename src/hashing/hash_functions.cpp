#include "hash_functions.hpp"

#include <stdexcept>

#include <boost/crc.hpp>

#define CRYPTOPP_ENABLE_NAMESPACE_WEAK 1
#include <crypto++/md5.h>
#include <crypto++/sha.h>

namespace {

uint32_t readLittleEndian32(const uint8_t* bytes) {
    return static_cast<uint32_t>(bytes[0])
        | (static_cast<uint32_t>(bytes[1]) << 8)
        | (static_cast<uint32_t>(bytes[2]) << 16)
        | (static_cast<uint32_t>(bytes[3]) << 24);
}

uint32_t rotl32(uint32_t x, int r) {
    return (x << r) | (x >> (32 - r));
}

uint32_t fmix32(uint32_t h) {
    h ^= h >> 16;
    h *= 0x85ebca6bU;
    h ^= h >> 13;
    h *= 0xc2b2ae35U;
    h ^= h >> 16;
    return h;
}

const std::vector<std::pair<std::string, HashAlgorithm>> ALGORITHM_NAMES = {
    {"simple", HashAlgorithm::SIMPLE_HASH},
    {"djb2", HashAlgorithm::DJB2_HASH},
    {"fnv1a", HashAlgorithm::FNV1A_HASH},
    {"md5", HashAlgorithm::MD5_HASH},
    {"sha1", HashAlgorithm::SHA1_HASH},
    {"crc32", HashAlgorithm::CRC32_HASH},
    {"murmur3", HashAlgorithm::MURMUR3_HASH},
};

} // namespace

// simple, djb2 and fnv1a work on the key's UTF-8 bytes, not on code points.

// Sum of byte values. Poor distribution, kept for comparison runs.
uint32_t simpleHash(const std::string& key) {
    uint32_t hash = 0;
    for (unsigned char c : key) {
        hash += c;
    }
    return hash;
}

uint32_t djb2Hash(const std::string& key) {
    uint32_t hash = 5381;
    for (unsigned char c : key) {
        hash = ((hash << 5) + hash) + c;
    }
    return hash;
}

uint32_t fnv1aHash(const std::string& key) {
    const uint32_t FNV_prime = 16777619u;
    const uint32_t offset_basis = 2166136261u;

    uint32_t hash = offset_basis;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= FNV_prime;
    }
    return hash;
}

uint32_t md5Hash(const std::string& key) {
    CryptoPP::Weak::MD5 md5;
    uint8_t digest[CryptoPP::Weak::MD5::DIGESTSIZE];
    md5.CalculateDigest(digest, reinterpret_cast<const CryptoPP::byte*>(key.data()), key.length());
    return readLittleEndian32(digest);
}

uint32_t sha1Hash(const std::string& key) {
    CryptoPP::SHA1 sha1;
    uint8_t digest[CryptoPP::SHA1::DIGESTSIZE];
    sha1.CalculateDigest(digest, reinterpret_cast<const CryptoPP::byte*>(key.data()), key.length());
    return readLittleEndian32(digest);
}

uint32_t crc32Hash(const std::string& key) {
    boost::crc_32_type crc;
    crc.process_bytes(key.data(), key.size());
    return crc.checksum();
}

// MurmurHash3 x86_32
uint32_t murmur3Hash(const std::string& key, uint32_t seed) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(key.data());
    const size_t len = key.size();
    const size_t nblocks = len / 4;
    const uint32_t c1 = 0xcc9e2d51U;
    const uint32_t c2 = 0x1b873593U;

    uint32_t h1 = seed;
    for (size_t i = 0; i < nblocks; ++i) {
        uint32_t k1 = readLittleEndian32(data + i * 4);
        k1 *= c1;
        k1 = rotl32(k1, 15);
        k1 *= c2;

        h1 ^= k1;
        h1 = rotl32(h1, 13);
        h1 = h1 * 5 + 0xe6546b64U;
    }

    const uint8_t* tail = data + nblocks * 4;
    uint32_t k1 = 0;
    switch (len & 3) {
        case 3:
            k1 ^= static_cast<uint32_t>(tail[2]) << 16;
            [[fallthrough]];
        case 2:
            k1 ^= static_cast<uint32_t>(tail[1]) << 8;
            [[fallthrough]];
        case 1:
            k1 ^= tail[0];
            k1 *= c1;
            k1 = rotl32(k1, 15);
            k1 *= c2;
            h1 ^= k1;
    }

    h1 ^= static_cast<uint32_t>(len);
    return fmix32(h1);
}

StandardHashFunction::StandardHashFunction(HashAlgorithm algorithm) : algorithm(algorithm) {
    // Reject values outside the enumeration before any ring uses us
    hashAlgorithmName(algorithm);
}

uint32_t StandardHashFunction::hash(const std::string& key) const {
    switch (algorithm) {
        case HashAlgorithm::SIMPLE_HASH:
            return simpleHash(key);
        case HashAlgorithm::DJB2_HASH:
            return djb2Hash(key);
        case HashAlgorithm::FNV1A_HASH:
            return fnv1aHash(key);
        case HashAlgorithm::MD5_HASH:
            return md5Hash(key);
        case HashAlgorithm::SHA1_HASH:
            return sha1Hash(key);
        case HashAlgorithm::CRC32_HASH:
            return crc32Hash(key);
        case HashAlgorithm::MURMUR3_HASH:
            return murmur3Hash(key);
    }
    throw std::logic_error("Unsupported hash algorithm: " + std::to_string(algorithm));
}

std::string StandardHashFunction::name() const {
    return hashAlgorithmName(algorithm);
}

std::shared_ptr<const HashFunction> createHashFunction(HashAlgorithm algorithm) {
    return std::make_shared<StandardHashFunction>(algorithm);
}

std::shared_ptr<const HashFunction> createHashFunction(const std::string& name) {
    return createHashFunction(parseHashAlgorithm(name));
}

HashAlgorithm parseHashAlgorithm(const std::string& name) {
    for (const auto& entry : ALGORITHM_NAMES) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    throw std::invalid_argument("Hash function '" + name + "' not found");
}

std::string hashAlgorithmName(HashAlgorithm algorithm) {
    for (const auto& entry : ALGORITHM_NAMES) {
        if (entry.second == algorithm) {
            return entry.first;
        }
    }
    throw std::invalid_argument("Unsupported hash algorithm: " + std::to_string(algorithm));
}

std::vector<std::string> availableHashAlgorithms() {
    std::vector<std::string> names;
    for (const auto& entry : ALGORITHM_NAMES) {
        names.push_back(entry.first);
    }
    return names;
}
