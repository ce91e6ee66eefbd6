#include "core/proof.hpp"

#include <stdexcept>
#include <utility>

bool ProofStep::operator==(const ProofStep &other) const
{
    return side_ == other.side_ && sibling_ == other.sibling_;
}

Proof::Proof(std::vector<ProofStep> steps) : steps_(std::move(steps))
{
}

std::size_t Proof::size() const
{
    return steps_.size();
}

bool Proof::empty() const
{
    return steps_.empty();
}

bool Proof::operator==(const Proof &other) const
{
    return steps_ == other.steps_;
}

std::string side_to_string(Side side)
{
    return side == Side::Left ? "left" : "right";
}

Side side_from_string(const std::string &str)
{
    if (str == "left")
    {
        return Side::Left;
    }
    if (str == "right")
    {
        return Side::Right;
    }
    throw std::invalid_argument("Invalid proof step position: " + str);
}

json Proof::to_json() const
{
    json res = json::array();
    for (const auto &step : steps_)
    {
        res.push_back({{"position", side_to_string(step.side_)},
                       {"data", util::to_hex(step.sibling_)}});
    }
    return res;
}

Proof Proof::from_json(const json &json_ob)
{
    if (!json_ob.is_array())
    {
        throw std::invalid_argument("Proof json must be an array.");
    }

    Proof p;
    for (const auto &step : json_ob)
    {
        if (!step.is_object() || !step.contains("position") || !step.contains("data") ||
            !step["position"].is_string() || !step["data"].is_string())
        {
            throw std::invalid_argument("Proof step must have string fields position and data.");
        }
        p.steps_.push_back(ProofStep{util::from_hex(step["data"].get<std::string>()),
                                     side_from_string(step["position"].get<std::string>())});
    }
    return p;
}

/*
message ProtoProof {
    repeated ProtoProofStep steps = 1;
}
*/

ProtoProof Proof::to_proto() const
{
    ProtoProof pp;
    for (const auto &step : steps_)
    {
        auto *ps = pp.add_steps();
        ps->set_sibling(std::string(step.sibling_.begin(), step.sibling_.end()));
        ps->set_side(step.side_ == Side::Left ? ProtoSide::SIDE_LEFT : ProtoSide::SIDE_RIGHT);
    }
    return pp;
}

Proof Proof::from_proto(const ProtoProof &proto)
{
    Proof p;
    for (const auto &ps : proto.steps())
    {
        Side side = Side::Left;
        switch (ps.side())
        {
        case ProtoSide::SIDE_LEFT:
            side = Side::Left;
            break;
        case ProtoSide::SIDE_RIGHT:
            side = Side::Right;
            break;
        default:
            throw std::invalid_argument("Invalid side in proto proof step.");
        }
        p.steps_.push_back(ProofStep{Digest(ps.sibling().begin(), ps.sibling().end()), side});
    }
    return p;
}

std::vector<std::string> Proof::hex_siblings() const
{
    std::vector<std::string> res;
    for (const auto &step : steps_)
    {
        res.push_back(util::to_hex(step.sibling_));
    }
    return res;
}
