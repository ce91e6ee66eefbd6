#include "core/blake2b_hasher.hpp"

#include "sodium.h"

Digest Blake2bHasher::hash(const std::vector<unsigned char> &data) const
{
    Digest res(crypto_generichash_BYTES);
    crypto_generichash(res.data(), crypto_generichash_BYTES, data.data(), data.size(), nullptr, 0);
    return res;
}

Digest Blake2bHasher::hash_nodes(const Digest &left, const Digest &right) const
{
    // left || right, hashed in two updates to skip the copy
    Digest res(crypto_generichash_BYTES);
    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES);
    crypto_generichash_update(&state, left.data(), left.size());
    crypto_generichash_update(&state, right.data(), right.size());
    crypto_generichash_final(&state, res.data(), crypto_generichash_BYTES);
    return res;
}

std::size_t Blake2bHasher::digest_size() const
{
    return crypto_generichash_BYTES;
}

std::string Blake2bHasher::name() const
{
    return "blake2b";
}
