#include "core/verifier.hpp"

bool Verifier::verify(const IHasher &hasher, const Digest &leaf, const Proof &proof, const Digest &root)
{
    const auto size = hasher.digest_size();
    if (leaf.size() != size || root.size() != size)
    {
        return false;
    }

    Digest running = leaf;
    for (const auto &step : proof.steps_)
    {
        if (step.sibling_.size() != size)
        {
            return false;
        }

        switch (step.side_)
        {
        case Side::Right:
            running = hasher.hash_nodes(running, step.sibling_);
            break;
        case Side::Left:
            running = hasher.hash_nodes(step.sibling_, running);
            break;
        default:
            return false;
        }
    }
    return running == root;
}

bool Verifier::verify_item(const IHasher &hasher, const std::vector<unsigned char> &item, const Proof &proof,
                           const Digest &root)
{
    return verify(hasher, hasher.hash(item), proof, root);
}
