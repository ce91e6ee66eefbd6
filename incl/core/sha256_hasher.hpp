#ifndef MKWL_SHA256_HASHER_HPP
#define MKWL_SHA256_HASHER_HPP

#include "core/interface/i_hasher.hpp"

class Sha256Hasher : public IHasher
{
public:
    Sha256Hasher() = default;

    Digest hash(const std::vector<unsigned char> &data) const override;
    Digest hash_nodes(const Digest &left, const Digest &right) const override;

    std::size_t digest_size() const override;
    std::string name() const override;
};

#endif
