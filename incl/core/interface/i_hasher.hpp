#ifndef MKWL_I_HASHER_HPP
#define MKWL_I_HASHER_HPP

#include <vector>
#include <string>
#include <cstddef>

using Digest = std::vector<unsigned char>;

/**
 * A hash function used for both roles of the tree:
 * - leaf hashing: hash(item)
 * - node hashing: hash_nodes(left, right) == hash(left || right)
 *
 * The concatenation order of hash_nodes is always left then right. Proofs
 * built with one hasher only verify with a hasher of the same name.
 */
class IHasher
{
public:
    virtual Digest hash(const std::vector<unsigned char> &data) const = 0;
    virtual Digest hash_nodes(const Digest &left, const Digest &right) const = 0;

    virtual std::size_t digest_size() const = 0;
    virtual std::string name() const = 0;

    virtual ~IHasher() = default;
};

#endif
