#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "sodium.h"
#include "base64.hpp"

#include "whitelist/whitelist.hpp"
#include "util/util.hpp"

using json = nlohmann::json;

int main(int argc, char **argv)
{
    std::string config_path = "config/whitelist.json";
    if (argc > 1)
    {
        config_path = argv[1];
    }

    if (sodium_init() < 0)
    {
        std::cerr << "could not initialize libsodium" << std::endl;
        return 1;
    }

    json config;
    std::vector<std::string> checks;
    bool print_proofs = false;
    bool print_tree = false;
    try
    {
        config = util::json_from_file(config_path);
        checks = util::config_entry<std::vector<std::string>>(config, "checks", {});
        print_proofs = util::config_value<bool>(config, "output", "print_proofs", false);
        print_tree = util::config_value<bool>(config, "output", "print_tree", false);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "loaded config from " << config_path << std::endl;

    std::unique_ptr<Whitelist> whitelist;
    try
    {
        whitelist = std::make_unique<Whitelist>(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error building whitelist: " << e.what() << std::endl;
        return 1;
    }

    auto tree = whitelist->snapshot();
    auto root = tree->root();
    std::cout << "hasher: " << whitelist->hasher()->name() << std::endl;
    std::cout << "entries: " << tree->leaf_count() << ", height: " << tree->height() << std::endl;
    std::cout << "root: " << tree->hex_root() << std::endl;
    std::cout << "root (base64): [" << base64::encode(root.data(), root.size()) << "]" << std::endl;

    if (print_tree)
    {
        tree->print();
    }

    for (const auto &entry : checks)
    {
        if (!whitelist->is_whitelisted(entry))
        {
            std::cout << entry << " is not whitelisted." << std::endl;
            continue;
        }

        std::cout << entry << " is whitelisted." << std::endl;
        if (print_proofs)
        {
            auto proof = tree->proof(whitelist->leaf_for(entry));
            json out = {{"leaf", util::to_hex(whitelist->leaf_for(entry))},
                        {"root", tree->hex_root()},
                        {"proof", proof.to_json()}};
            std::cout << out.dump(4) << std::endl;
        }
    }

    return 0;
}
