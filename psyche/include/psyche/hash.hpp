#pragma once
// Hashing: SHA-256 over packed big-endian words
//
// The packing mirrors a tightly packed ABI encoding: every integer is
// written as a 32-byte big-endian word, digests are written raw.

#include "types.hpp"
#include <string>
#include <vector>

namespace psyche {

Digest sha256(const uint8_t* data, size_t len);
Digest sha256(const std::string& text);

// Accumulates the preimage for a derived digest
class Packer {
public:
    Packer& word(uint64_t value);
    Packer& digest(const Digest& d);

    Digest sha256() const;
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

// Reduce a digest, read as a 256-bit big-endian integer, modulo m (m > 0)
uint64_t digest_mod(const Digest& d, uint64_t m);

std::string to_hex(const Digest& d);

} // namespace psyche
