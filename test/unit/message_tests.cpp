// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "infra/test_helpers.hpp"
#include "network/message.hpp"

using namespace mintnode;
using namespace mintnode::message;

TEST_CASE("Message types map to the right kind", "[message]") {
    MessageKind kind;

    REQUIRE(kind_of(static_cast<uint8_t>(MessageType::HANDSHAKE), kind));
    CHECK(kind == MessageKind::REQUEST);
    REQUIRE(kind_of(static_cast<uint8_t>(MessageType::PING), kind));
    CHECK(kind == MessageKind::REQUEST);
    REQUIRE(kind_of(static_cast<uint8_t>(MessageType::ERROR), kind));
    CHECK(kind == MessageKind::RESPONSE);
    REQUIRE(kind_of(static_cast<uint8_t>(MessageType::BLOCK_PRODUCED), kind));
    CHECK(kind == MessageKind::NOTIFICATION);

    CHECK_FALSE(kind_of(0x00, kind));
    CHECK_FALSE(kind_of(0x09, kind));
    CHECK_FALSE(kind_of(0x40, kind));
    CHECK_FALSE(kind_of(0xFF, kind));
}

TEST_CASE("create_message builds every known type", "[message]") {
    for (int raw = 0; raw <= 0xFF; ++raw) {
        MessageKind kind;
        bool known = kind_of(static_cast<uint8_t>(raw), kind);
        auto msg = create_message(static_cast<MessageType>(raw));
        if (known) {
            REQUIRE(msg);
            CHECK(static_cast<int>(msg->type()) == raw);
            CHECK(msg->kind() == kind);
        } else {
            CHECK_FALSE(msg);
        }
    }
}

TEST_CASE("SubmitTx carries every transaction field", "[message]") {
    auto tx = test::MakeTransaction("alice", "bob", 250, 12, 1700000000123);
    tx.signature.assign(64, 0x5A);

    SubmitTxRequest out(tx);
    auto bytes = out.serialize();

    SubmitTxRequest in;
    REQUIRE(in.deserialize(bytes.data(), bytes.size()));
    CHECK(in.tx == tx);
}

TEST_CASE("Block bodies carry their transactions", "[message]") {
    auto block = test::MakeBlock(9);
    block.reward = 30;
    block.transactions.push_back(test::MakeTransaction("a", "b", 1, 10, 1, 1));
    block.transactions.push_back(test::MakeTransaction("b", "c", 2, 20, 2, 2));

    BlockResponse out(block);
    auto bytes = out.serialize();

    BlockResponse in;
    REQUIRE(in.deserialize(bytes.data(), bytes.size()));
    CHECK(in.block == block);
    CHECK(in.block.transactions.size() == 2);
}

TEST_CASE("Error responses reject codes outside the defined range", "[message]") {
    ErrorResponse out(ErrorCode::PROTOCOL, "nope");
    auto bytes = out.serialize();

    ErrorResponse ok;
    REQUIRE(ok.deserialize(bytes.data(), bytes.size()));
    CHECK(ok.code == ErrorCode::PROTOCOL);
    CHECK(ok.detail == "nope");

    bytes[0] = 0;
    ErrorResponse zero;
    CHECK_FALSE(zero.deserialize(bytes.data(), bytes.size()));

    bytes[0] = 99;
    ErrorResponse high;
    CHECK_FALSE(high.deserialize(bytes.data(), bytes.size()));
}

TEST_CASE("Strings over the length limit fail to parse", "[message]") {
    GetBalanceRequest out(std::string(protocol::MAX_STRING_LENGTH + 1, 'x'));
    auto bytes = out.serialize();

    GetBalanceRequest in;
    CHECK_FALSE(in.deserialize(bytes.data(), bytes.size()));

    GetBalanceRequest at_limit_out(std::string(protocol::MAX_STRING_LENGTH, 'x'));
    auto at_limit = at_limit_out.serialize();
    GetBalanceRequest at_limit_in;
    CHECK(at_limit_in.deserialize(at_limit.data(), at_limit.size()));
}

TEST_CASE("serialize_transaction is canonical", "[message]") {
    auto a = test::MakeTransaction("alice", "bob", 100, 10, 5000, 3);
    auto b = a;
    CHECK(serialize_transaction(a) == serialize_transaction(b));

    b.fee = 11;
    CHECK(serialize_transaction(a) != serialize_transaction(b));
}

TEST_CASE("Handshake response carries session and height", "[message]") {
    HandshakeResponse out;
    out.protocol_version = protocol::PROTOCOL_VERSION;
    out.user_agent = "/mintnode:test/";
    out.session_id = 77;
    out.chain_height = 1234;
    auto bytes = out.serialize();

    HandshakeResponse in;
    REQUIRE(in.deserialize(bytes.data(), bytes.size()));
    CHECK(in.protocol_version == protocol::PROTOCOL_VERSION);
    CHECK(in.user_agent == "/mintnode:test/");
    CHECK(in.session_id == 77);
    CHECK(in.chain_height == 1234);
}
