#include "core/hasher_factory.hpp"

#include "core/sha256_hasher.hpp"
#include "core/blake2b_hasher.hpp"

#include <stdexcept>

std::shared_ptr<const IHasher> HasherFactory::create(const std::string &name)
{
    if (name == "sha256")
    {
        return std::make_shared<Sha256Hasher>();
    }
    if (name == "blake2b")
    {
        return std::make_shared<Blake2bHasher>();
    }
    throw std::invalid_argument("Unknown hasher: " + name);
}
