#ifndef MKWL_VERIFIER_HPP
#define MKWL_VERIFIER_HPP

#include <vector>

#include "core/interface/i_hasher.hpp"
#include "core/proof.hpp"

/**
 * Stateless inclusion proof check. Needs only the hasher the tree was built
 * with, the leaf digest, the proof and the claimed root.
 *
 * Never throws for a bad proof. Digests of the wrong length fail closed.
 */
class Verifier
{
public:
    static bool verify(const IHasher &hasher, const Digest &leaf, const Proof &proof, const Digest &root);

    // Hashes item to its leaf digest first
    static bool verify_item(const IHasher &hasher, const std::vector<unsigned char> &item, const Proof &proof,
                            const Digest &root);
};

#endif
