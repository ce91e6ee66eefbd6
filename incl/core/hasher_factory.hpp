#ifndef MKWL_HASHER_FACTORY_HPP
#define MKWL_HASHER_FACTORY_HPP

#include "core/interface/i_hasher.hpp"

#include <memory>
#include <string>

class HasherFactory
{
public:
    // "sha256" or "blake2b", throws std::invalid_argument otherwise
    static std::shared_ptr<const IHasher> create(const std::string &name);
};

#endif
