#include "core/merkle.hpp"

#include "core/errors.hpp"
#include "core/verifier.hpp"
#include "util/util.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <algorithm>

MerkleTree::MerkleTree(std::shared_ptr<const IHasher> hasher) : hasher_(std::move(hasher))
{
    if (!hasher_)
    {
        throw std::invalid_argument("Merkle tree needs a hasher.");
    }
    digest_size_ = hasher_->digest_size();
}

MerkleTree::MerkleTree(const std::vector<std::vector<unsigned char>> &items, std::shared_ptr<const IHasher> hasher)
    : MerkleTree(std::move(hasher))
{
    std::vector<unsigned char> leaf_layer;
    leaf_layer.reserve(items.size() * digest_size_);
    for (const auto &item : items)
    {
        auto leaf = hasher_->hash(item);
        leaf_layer.insert(leaf_layer.end(), leaf.begin(), leaf.end());
    }
    build(std::move(leaf_layer));
}

MerkleTree MerkleTree::from_leaves(const std::vector<Digest> &leaves, std::shared_ptr<const IHasher> hasher)
{
    MerkleTree tree(std::move(hasher));

    std::vector<unsigned char> leaf_layer;
    leaf_layer.reserve(leaves.size() * tree.digest_size_);
    for (const auto &leaf : leaves)
    {
        if (leaf.size() != tree.digest_size_)
        {
            throw std::invalid_argument("Leaf size does not match the digest size of the hasher.");
        }
        leaf_layer.insert(leaf_layer.end(), leaf.begin(), leaf.end());
    }
    tree.build(std::move(leaf_layer));
    return tree;
}

void MerkleTree::build(std::vector<unsigned char> leaf_layer)
{
    layers_.clear();
    layers_.push_back(std::move(leaf_layer));

    if (node_count(0) == 0)
    {
        // empty set sentinel
        root_ = hasher_->hash({});
        return;
    }

    while (node_count(layers_.size() - 1) > 1)
    {
        layers_.push_back(compute_next_layer(layers_.back()));
    }

    root_ = node(layers_.size() - 1, 0);
}

std::vector<unsigned char> MerkleTree::compute_next_layer(const std::vector<unsigned char> &current) const
{
    std::size_t count = current.size() / digest_size_;

    std::vector<unsigned char> next_level;
    next_level.reserve(((count + 1) / 2) * digest_size_);

    for (std::size_t i = 0; i < count; i += 2)
    {
        auto left_begin = current.begin() + i * digest_size_;
        Digest left(left_begin, left_begin + digest_size_);

        // if odd number in current level, duplicate last
        Digest right = left;
        if (i + 1 < count)
        {
            auto right_begin = left_begin + digest_size_;
            right.assign(right_begin, right_begin + digest_size_);
        }

        auto parent = hasher_->hash_nodes(left, right);
        next_level.insert(next_level.end(), parent.begin(), parent.end());
    }
    return next_level;
}

std::size_t MerkleTree::node_count(std::size_t level) const
{
    return layers_[level].size() / digest_size_;
}

Digest MerkleTree::node(std::size_t level, std::size_t index) const
{
    auto begin = layers_[level].begin() + index * digest_size_;
    return Digest(begin, begin + digest_size_);
}

const Digest &MerkleTree::root() const
{
    return root_;
}

std::string MerkleTree::hex_root() const
{
    return util::to_hex(root_);
}

std::size_t MerkleTree::leaf_count() const
{
    return node_count(0);
}

std::size_t MerkleTree::height() const
{
    return layers_.size() - 1;
}

std::size_t MerkleTree::layer_count() const
{
    return layers_.size();
}

Digest MerkleTree::leaf(std::size_t index) const
{
    if (index >= leaf_count())
    {
        throw NotFoundError("Leaf index out of range.");
    }
    return node(0, index);
}

std::vector<Digest> MerkleTree::leaves() const
{
    return layer(0);
}

std::vector<Digest> MerkleTree::layer(std::size_t level) const
{
    if (level >= layers_.size())
    {
        throw std::out_of_range("Layer index out of range.");
    }

    std::vector<Digest> res;
    res.reserve(node_count(level));
    for (std::size_t i = 0; i < node_count(level); ++i)
    {
        res.push_back(node(level, i));
    }
    return res;
}

std::size_t MerkleTree::leaf_index(const Digest &leaf) const
{
    if (leaf.size() == digest_size_)
    {
        const auto &leaf_layer = layers_[0];
        for (std::size_t i = 0; i < leaf_count(); ++i)
        {
            if (std::equal(leaf.begin(), leaf.end(), leaf_layer.begin() + i * digest_size_))
            {
                return i;
            }
        }
    }
    throw NotFoundError("Leaf not found in tree: " + util::to_hex(leaf));
}

bool MerkleTree::contains(const Digest &leaf) const
{
    try
    {
        leaf_index(leaf);
        return true;
    }
    catch (const NotFoundError &)
    {
        return false;
    }
}

Proof MerkleTree::proof(std::size_t index) const
{
    if (index >= leaf_count())
    {
        throw NotFoundError("Leaf index out of range.");
    }

    Proof p;
    p.steps_.reserve(height());
    for (std::size_t level = 0; level + 1 < layers_.size(); ++level)
    {
        std::size_t sibling = index ^ 1;
        if (sibling >= node_count(level))
        {
            // last node of an odd layer is paired with itself
            sibling = index;
        }

        Side side = (index & 1) ? Side::Left : Side::Right;
        p.steps_.push_back(ProofStep{node(level, sibling), side});
        index >>= 1;
    }
    return p;
}

Proof MerkleTree::proof(const Digest &leaf) const
{
    return proof(leaf_index(leaf));
}

std::vector<Proof> MerkleTree::proofs() const
{
    std::vector<Proof> res;
    res.reserve(leaf_count());
    for (std::size_t i = 0; i < leaf_count(); ++i)
    {
        res.push_back(proof(i));
    }
    return res;
}

bool MerkleTree::verify(const Proof &proof, const Digest &leaf) const
{
    return Verifier::verify(*hasher_, leaf, proof, root_);
}

std::shared_ptr<const IHasher> MerkleTree::hasher() const
{
    return hasher_;
}

std::string MerkleTree::to_string() const
{
    // root first, one layer per line
    std::stringstream ss;
    ss << "merkle tree (" << hasher_->name() << ", " << leaf_count() << " leaves, height " << height() << ")" << std::endl;
    if (leaf_count() == 0)
    {
        ss << util::to_hex(root_) << std::endl;
        return ss.str();
    }

    for (std::size_t level = layers_.size(); level-- > 0;)
    {
        ss << "L" << level << ":";
        for (std::size_t i = 0; i < node_count(level); ++i)
        {
            ss << "  " << util::to_hex(node(level, i));
        }
        ss << std::endl;
    }
    return ss.str();
}

void MerkleTree::print() const
{
    std::cout << "==============" << std::endl;
    std::cout << to_string();
    std::cout << "==============" << std::endl;
}
