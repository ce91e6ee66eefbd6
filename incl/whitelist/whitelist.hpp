#ifndef MKWL_WHITELIST_HPP
#define MKWL_WHITELIST_HPP

#include "nlohmann/json.hpp"

#include "core/interface/i_hasher.hpp"
#include "core/merkle.hpp"
#include "core/proof.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * Set of entries (email addresses in practice) committed to by a Merkle root.
 *
 * The tree is replaced as a whole on rebuild. Readers grab the current
 * snapshot and never observe a partially built tree.
 */
class Whitelist
{
public:
    Whitelist(std::shared_ptr<const IHasher> hasher, bool normalize = false);
    Whitelist(const json &config);

    void rebuild(const std::vector<std::string> &entries);

    std::shared_ptr<const MerkleTree> snapshot() const;

    Digest root() const;
    std::string hex_root() const;
    std::size_t size() const;

    // Trimmed and lower-cased when normalization is on
    std::string normalize(const std::string &entry) const;
    Digest leaf_for(const std::string &entry) const;

    // Throws NotFoundError when the entry is not whitelisted
    Proof prove(const std::string &entry) const;
    bool is_whitelisted(const std::string &entry) const;

    std::shared_ptr<const IHasher> hasher() const;

private:
    mutable std::mutex whitelist_mu_;
    std::shared_ptr<const IHasher> hasher_;
    bool normalize_;
    std::shared_ptr<const MerkleTree> tree_;
};

#endif
