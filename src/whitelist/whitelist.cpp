#include "whitelist/whitelist.hpp"

#include "core/errors.hpp"
#include "core/hasher_factory.hpp"
#include "core/verifier.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

Whitelist::Whitelist(std::shared_ptr<const IHasher> hasher, bool normalize)
    : hasher_(std::move(hasher)), normalize_(normalize)
{
    tree_ = std::make_shared<MerkleTree>(std::vector<std::vector<unsigned char>>{}, hasher_);
}

Whitelist::Whitelist(const json &config)
    : Whitelist(HasherFactory::create(util::config_value<std::string>(config, "merkle", "hasher", "sha256")),
                util::config_value<bool>(config, "whitelist", "normalize", false))
{
    auto entries = util::config_value<std::vector<std::string>>(config, "whitelist", "entries", {});
    if (!entries.empty())
    {
        rebuild(entries);
    }
}

void Whitelist::rebuild(const std::vector<std::string> &entries)
{
    std::vector<std::vector<unsigned char>> items;
    items.reserve(entries.size());
    for (const auto &entry : entries)
    {
        items.push_back(util::to_bytes(normalize(entry)));
    }

    // build off-lock, readers keep the old snapshot until the swap
    auto new_tree = std::make_shared<MerkleTree>(items, hasher_);

    {
        std::lock_guard<std::mutex> lg(whitelist_mu_);
        tree_ = new_tree;
    }
    std::cout << "rebuilt whitelist with " << entries.size() << " entries, root: " << new_tree->hex_root() << std::endl;
}

std::shared_ptr<const MerkleTree> Whitelist::snapshot() const
{
    std::lock_guard<std::mutex> lg(whitelist_mu_);
    return tree_;
}

Digest Whitelist::root() const
{
    return snapshot()->root();
}

std::string Whitelist::hex_root() const
{
    return snapshot()->hex_root();
}

std::size_t Whitelist::size() const
{
    return snapshot()->leaf_count();
}

std::string Whitelist::normalize(const std::string &entry) const
{
    if (!normalize_)
    {
        return entry;
    }

    auto begin = std::find_if_not(entry.begin(), entry.end(), [](unsigned char c)
                                  { return std::isspace(c); });
    auto end = std::find_if_not(entry.rbegin(), entry.rend(), [](unsigned char c)
                                { return std::isspace(c); })
                   .base();

    std::string res;
    if (begin < end)
    {
        res.assign(begin, end);
    }
    std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return res;
}

Digest Whitelist::leaf_for(const std::string &entry) const
{
    return hasher_->hash(util::to_bytes(normalize(entry)));
}

Proof Whitelist::prove(const std::string &entry) const
{
    return snapshot()->proof(leaf_for(entry));
}

bool Whitelist::is_whitelisted(const std::string &entry) const
{
    auto tree = snapshot();
    auto leaf = leaf_for(entry);

    Proof p;
    try
    {
        p = tree->proof(leaf);
    }
    catch (const NotFoundError &)
    {
        return false;
    }
    return Verifier::verify(*hasher_, leaf, p, tree->root());
}

std::shared_ptr<const IHasher> Whitelist::hasher() const
{
    return hasher_;
}
