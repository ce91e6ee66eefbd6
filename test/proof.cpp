#define BOOST_TEST_MODULE mkwl_proof_test

#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/merkle.hpp"
#include "core/proof.hpp"
#include "core/sha256_hasher.hpp"
#include "core/verifier.hpp"
#include "util/util.hpp"

namespace {
    MerkleTree email_tree() {
        std::vector<std::vector<unsigned char>> items = {util::to_bytes("example1@mail.com"),
                                                         util::to_bytes("example2@mail.com"),
                                                         util::to_bytes("example3@mail.com")};
        return MerkleTree(items, std::make_shared<Sha256Hasher>());
    }
}

BOOST_AUTO_TEST_SUITE(mkwl_proof_test_suite)

BOOST_AUTO_TEST_CASE(json_layout) {
    auto tree = email_tree();
    auto j = tree.proof(1).to_json();

    BOOST_REQUIRE(j.is_array());
    BOOST_REQUIRE_EQUAL(j.size(), 2u);
    BOOST_CHECK_EQUAL(j[0]["position"].get<std::string>(), "left");
    BOOST_CHECK_EQUAL(j[0]["data"].get<std::string>(),
                      "c3dead985e4436f57ce8909c3393b2b16377ac04f936113361034931889e0afa");
    BOOST_CHECK_EQUAL(j[1]["position"].get<std::string>(), "right");
    BOOST_CHECK_EQUAL(j[1]["data"].get<std::string>(),
                      "6a49798566a5faace29863bdf11aa0dbc6f18fd764d007b338e01c349cabe3b1");
}

BOOST_AUTO_TEST_CASE(json_decode_verifies) {
    auto tree = email_tree();
    auto text = tree.proof(1).to_json().dump();

    // what a remote verifier holding only the root would receive
    auto decoded = Proof::from_json(json::parse(text));
    BOOST_CHECK(decoded == tree.proof(1));

    Sha256Hasher hasher;
    BOOST_CHECK(Verifier::verify_item(hasher, util::to_bytes("example2@mail.com"), decoded,
                                      util::from_hex(tree.hex_root())));
}

BOOST_AUTO_TEST_CASE(json_decode_accepts_0x_prefix) {
    json j = json::array();
    j.push_back({{"position", "right"}, {"data", "0xAB01"}});

    auto p = Proof::from_json(j);
    BOOST_REQUIRE_EQUAL(p.size(), 1u);
    BOOST_CHECK(p.steps_[0].side_ == Side::Right);
    BOOST_CHECK(p.steps_[0].sibling_ == (Digest{0xab, 0x01}));
}

BOOST_AUTO_TEST_CASE(json_decode_rejects_malformed) {
    BOOST_CHECK_THROW(Proof::from_json(json::object()), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"([{"position": "up", "data": "00"}])")), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"([{"position": "left", "data": "0g"}])")), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"([{"position": "left", "data": "abc"}])")), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"([{"position": "left"}])")), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"([{"position": 1, "data": "00"}])")), std::invalid_argument);
    BOOST_CHECK_THROW(Proof::from_json(json::parse(R"(["00"])")), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(json_wrong_length_sibling_decodes_but_fails_verify) {
    auto tree = email_tree();
    auto j = tree.proof(1).to_json();
    j[0]["data"] = "00ff";

    auto p = Proof::from_json(j);
    Sha256Hasher hasher;
    BOOST_CHECK(!Verifier::verify_item(hasher, util::to_bytes("example2@mail.com"), p, tree.root()));
}

BOOST_AUTO_TEST_CASE(proto_encode_decode) {
    auto tree = email_tree();
    auto proof = tree.proof(2);

    std::string wire;
    BOOST_REQUIRE(proof.to_proto().SerializeToString(&wire));

    ProtoProof parsed;
    BOOST_REQUIRE(parsed.ParseFromString(wire));
    BOOST_REQUIRE_EQUAL(parsed.steps_size(), 2);
    BOOST_CHECK(parsed.steps(0).side() == ProtoSide::SIDE_RIGHT);
    BOOST_CHECK(parsed.steps(1).side() == ProtoSide::SIDE_LEFT);

    auto decoded = Proof::from_proto(parsed);
    BOOST_CHECK(decoded == proof);
    BOOST_CHECK(tree.verify(decoded, tree.leaf(2)));
}

BOOST_AUTO_TEST_CASE(proto_rejects_unknown_side) {
    ProtoProof pp;
    auto *step = pp.add_steps();
    step->set_sibling(std::string(32, '\0'));
    step->set_side(static_cast<ProtoSide>(7));

    BOOST_CHECK_THROW(Proof::from_proto(pp), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(hex_siblings_in_order) {
    auto tree = email_tree();
    auto hex = tree.proof(0).hex_siblings();

    BOOST_REQUIRE_EQUAL(hex.size(), 2u);
    BOOST_CHECK_EQUAL(hex[0], "b8759dd818f47ff0c6e03a174d14ed5ada1f9821f60024030d08bd951a7e8dfe");
    BOOST_CHECK_EQUAL(hex[1], "6a49798566a5faace29863bdf11aa0dbc6f18fd764d007b338e01c349cabe3b1");
}

BOOST_AUTO_TEST_CASE(side_names) {
    BOOST_CHECK_EQUAL(side_to_string(Side::Left), "left");
    BOOST_CHECK_EQUAL(side_to_string(Side::Right), "right");
    BOOST_CHECK(side_from_string("left") == Side::Left);
    BOOST_CHECK(side_from_string("right") == Side::Right);
    BOOST_CHECK_THROW(side_from_string("LEFT"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
