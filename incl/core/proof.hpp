#ifndef MKWL_PROOF_HPP
#define MKWL_PROOF_HPP

#include <vector>
#include <string>

#include "core/interface/i_hasher.hpp"
#include "util/util.hpp"

#include "message.pb.h"

// Where the sibling goes relative to the running hash
enum class Side
{
    Left = 0,
    Right
};

struct ProofStep
{
    Digest sibling_;
    Side side_;

    bool operator==(const ProofStep &other) const;
};

/**
 * Inclusion proof: sibling digests ordered from the leaf level up to, but not
 * including, the root level. Steps must be replayed in this order.
 */
class Proof
{
public:
    std::vector<ProofStep> steps_;

    Proof() = default;
    explicit Proof(std::vector<ProofStep> steps);

    std::size_t size() const;
    bool empty() const;

    bool operator==(const Proof &other) const;

    // [{"position": "left"|"right", "data": "<hex>"}, ...]
    json to_json() const;
    static Proof from_json(const json &json_ob);

    ProtoProof to_proto() const;
    static Proof from_proto(const ProtoProof &proto);

    // Siblings only, as hex strings
    std::vector<std::string> hex_siblings() const;
};

std::string side_to_string(Side side);
Side side_from_string(const std::string &str);

#endif
