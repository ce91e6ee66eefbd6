#ifndef MKWL_MERKLE_HPP
#define MKWL_MERKLE_HPP

#include <vector>
#include <memory>
#include <string>
#include <cstddef>

#include "core/interface/i_hasher.hpp"
#include "core/proof.hpp"

/**
 * Binary Merkle tree over an ordered list of items.
 *
 * The tree is immutable once constructed. Each layer is kept as one contiguous
 * buffer of digest_size() * count bytes, layer 0 being the leaves. A layer with
 * an odd number of nodes pairs its last node with itself.
 *
 * An empty tree has the hash of the empty byte sequence as its root and no
 * proofs. A single leaf tree has that leaf as its root and height 0.
 */
class MerkleTree
{
public:
    MerkleTree(const std::vector<std::vector<unsigned char>> &items, std::shared_ptr<const IHasher> hasher);

    // leaves must already be digests of the given hasher
    static MerkleTree from_leaves(const std::vector<Digest> &leaves, std::shared_ptr<const IHasher> hasher);

    const Digest &root() const;
    std::string hex_root() const;

    std::size_t leaf_count() const;
    std::size_t height() const;
    std::size_t layer_count() const;

    Digest leaf(std::size_t index) const;
    std::vector<Digest> leaves() const;
    std::vector<Digest> layer(std::size_t level) const;

    // First index holding this digest. Throws NotFoundError
    std::size_t leaf_index(const Digest &leaf) const;
    bool contains(const Digest &leaf) const;

    // Both throw NotFoundError when the leaf is not in the tree
    Proof proof(std::size_t index) const;
    Proof proof(const Digest &leaf) const;
    std::vector<Proof> proofs() const;

    // Verify against this tree's root with this tree's hasher
    bool verify(const Proof &proof, const Digest &leaf) const;

    std::shared_ptr<const IHasher> hasher() const;

    std::string to_string() const;
    void print() const;

private:
    std::shared_ptr<const IHasher> hasher_;
    std::size_t digest_size_;
    std::vector<std::vector<unsigned char>> layers_;
    Digest root_;

    explicit MerkleTree(std::shared_ptr<const IHasher> hasher);

    void build(std::vector<unsigned char> leaf_layer);
    std::vector<unsigned char> compute_next_layer(const std::vector<unsigned char> &current) const;

    std::size_t node_count(std::size_t level) const;
    Digest node(std::size_t level, std::size_t index) const;
};

#endif
