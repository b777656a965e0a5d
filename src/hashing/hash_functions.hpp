#ifndef HASH_FUNCTIONS_HPP
#define HASH_FUNCTIONS_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "enums.hpp"

// Width of every hash value placed on a ring.
const int RING_HASH_BITS = 32;

class HashFunction {
public:
    virtual ~HashFunction() = default;

    virtual uint32_t hash(const std::string& key) const = 0;

    virtual int outputBits() const { return RING_HASH_BITS; }

    virtual std::string name() const = 0;
};

// One of the built-in algorithms, chosen when the ring is built.
class StandardHashFunction : public HashFunction {
public:
    explicit StandardHashFunction(HashAlgorithm algorithm);

    uint32_t hash(const std::string& key) const override;

    std::string name() const override;

    HashAlgorithm getAlgorithm() const { return algorithm; }

private:
    HashAlgorithm algorithm;
};

std::shared_ptr<const HashFunction> createHashFunction(HashAlgorithm algorithm);
std::shared_ptr<const HashFunction> createHashFunction(const std::string& name);

HashAlgorithm parseHashAlgorithm(const std::string& name);
std::string hashAlgorithmName(HashAlgorithm algorithm);
std::vector<std::string> availableHashAlgorithms();

uint32_t simpleHash(const std::string& key);
uint32_t djb2Hash(const std::string& key);
uint32_t fnv1aHash(const std::string& key);
uint32_t md5Hash(const std::string& key);
uint32_t sha1Hash(const std::string& key);
uint32_t crc32Hash(const std::string& key);
uint32_t murmur3Hash(const std::string& key, uint32_t seed = 0);

#endif // HASH_FUNCTIONS_HPP
