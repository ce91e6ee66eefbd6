#ifndef MKWL_BLAKE2B_HASHER_HPP
#define MKWL_BLAKE2B_HASHER_HPP

#include "core/interface/i_hasher.hpp"

// Unkeyed BLAKE2b with a 32 byte output (libsodium generichash)
class Blake2bHasher : public IHasher
{
public:
    Blake2bHasher() = default;

    Digest hash(const std::vector<unsigned char> &data) const override;
    Digest hash_nodes(const Digest &left, const Digest &right) const override;

    std::size_t digest_size() const override;
    std::string name() const override;
};

#endif
