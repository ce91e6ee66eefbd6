#include "core/sha256_hasher.hpp"

#include "util/util.hpp"

#include "sodium.h"

Digest Sha256Hasher::hash(const std::vector<unsigned char> &data) const
{
    Digest res(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(res.data(), data.data(), data.size());
    return res;
}

Digest Sha256Hasher::hash_nodes(const Digest &left, const Digest &right) const
{
    return hash(util::concat(left, right));
}

std::size_t Sha256Hasher::digest_size() const
{
    return crypto_hash_sha256_BYTES;
}

std::string Sha256Hasher::name() const
{
    return "sha256";
}
