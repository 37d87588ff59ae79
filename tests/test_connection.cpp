#include <gtest/gtest.h>

#include <cstring>

#include "FakeServer.hpp"
#include "juicebox/display/Connection.hpp"
#include "juicebox/protocol/Errors.hpp"
#include "juicebox/protocol/Events.hpp"

using namespace juicebox;
using juicebox::test::FakeServer;

namespace {

ConnectionError::Kind handshakeFailure(FakeServer& server) {
    try {
        server.handshake();
    } catch (const ConnectionError& e) {
        return e.getKind();
    }
    ADD_FAILURE() << "handshake unexpectedly succeeded";
    return ConnectionError::Kind::Io;
}

}

TEST(ConnectionTest, HandshakeDecodesSetup) {
    FakeServer server;
    auto connection = server.connect();

    EXPECT_EQ(connection->getStatus(), Connection::Status::Ok);
    EXPECT_EQ(connection->getVendor(), "Fake X Server");
    EXPECT_EQ(connection->getSetup().min_keycode, 8);
    EXPECT_EQ(connection->getSetup().max_keycode, 255);
    ASSERT_EQ(connection->getFormats().size(), 1u);
    EXPECT_EQ(connection->getFormats()[0].bits_per_pixel, 32);

    const Screen& screen = connection->getDefaultScreen();
    EXPECT_EQ(screen.root, 0x100u);
    EXPECT_EQ(screen.width_in_pixels, 800);
    EXPECT_EQ(screen.height_in_pixels, 600);
    ASSERT_EQ(screen.depths.size(), 1u);
    ASSERT_EQ(screen.depths[0].visual_types.size(), 1u);
    EXPECT_EQ(screen.depths[0].visual_types[0].visual_id, 0x21u);
}

TEST(ConnectionTest, TrailingSetupBytesAreRejected) {
    FakeServer server;
    FakeServer::Options options;
    options.trailing_bytes = 4;
    server.writeBytes(FakeServer::setupReply(options));

    EXPECT_EQ(handshakeFailure(server), ConnectionError::Kind::SetupIntegrity);
}

TEST(ConnectionTest, RefusedSetupCarriesReason) {
    FakeServer server;

    std::string reason = "no way";
    protocol::SetupReplyHeader header{};
    header.status = static_cast<std::uint8_t>(protocol::SetupStatus::Failed);
    header.reason_len = static_cast<std::uint8_t>(reason.size());
    header.length = 2;

    protocol::RequestBuffer reply;
    reply.put(header);
    reply.putString(reason);
    reply.align();
    server.writeBytes(reply.bytes());

    try {
        server.handshake();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.getKind(), ConnectionError::Kind::SetupRejected);
        EXPECT_NE(std::string(e.what()).find("no way"), std::string::npos);
    }
}

TEST(ConnectionTest, AuthenticateStatusFails) {
    FakeServer server;

    protocol::SetupReplyHeader header{};
    header.status = static_cast<std::uint8_t>(protocol::SetupStatus::Authenticate);
    header.length = 1;

    protocol::RequestBuffer reply;
    reply.put(header);
    reply.putString("more");
    server.writeBytes(reply.bytes());

    EXPECT_EQ(handshakeFailure(server), ConnectionError::Kind::AuthenticationFailed);
}

TEST(ConnectionTest, SequenceNumbersIncrease) {
    FakeServer server;
    auto connection = server.connect();

    protocol::MapWindowRequest map{};
    map.window = 0x400001;
    EXPECT_EQ(connection->send(map), 1);
    EXPECT_EQ(connection->send(map), 2);
    EXPECT_EQ(connection->getLastSequence(), 2);

    auto requests = server.takeRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].opcode(), protocol::opcode::MapWindow);
    EXPECT_EQ(requests[0].as<protocol::MapWindowRequest>().window, 0x400001u);
}

TEST(ConnectionTest, ResourceIdsWalkTheGrantedRange) {
    FakeServer server;
    FakeServer::Options options;
    options.resource_id_mask = 0x3;
    auto connection = server.connect(options);

    EXPECT_EQ(connection->generateId(), 0x400000u);
    EXPECT_EQ(connection->generateId(), 0x400001u);
    EXPECT_EQ(connection->generateId(), 0x400002u);
    // base | mask is still handed out before the range counts as spent
    EXPECT_EQ(connection->generateId(), 0x400003u);
    EXPECT_TRUE(server.takeRequests().empty());
}

TEST(ConnectionTest, ExhaustedRangeIsRefilledThroughXcMisc) {
    FakeServer server;
    FakeServer::Options options;
    options.resource_id_mask = 0x3;
    auto connection = server.connect(options);

    for (int i = 0; i < 4; ++i) {
        connection->generateId();
    }

    server.replyQueryExtension(true, 136);
    server.replyXidRange(0x400001, 2);
    EXPECT_EQ(connection->generateId(), 0x400001u);
    EXPECT_EQ(connection->generateId(), 0x400002u);

    auto requests = server.takeRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].opcode(), protocol::opcode::QueryExtension);
    EXPECT_EQ(requests[0].tail(sizeof(protocol::QueryExtensionRequest), 7), "XC-MISC");
    EXPECT_EQ(requests[1].opcode(), 136);
    EXPECT_EQ(requests[1].data(), protocol::opcode::XCMiscGetXIDRange);

    // The extension lookup is cached; only the range is asked for again
    server.replyXidRange(0x400003, 1);
    EXPECT_EQ(connection->generateId(), 0x400003u);
    requests = server.takeRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].opcode(), 136);
}

TEST(ConnectionTest, ExhaustedRangeWithoutXcMiscThrows) {
    FakeServer server;
    FakeServer::Options options;
    options.resource_id_mask = 0x1;
    auto connection = server.connect(options);

    connection->generateId();
    connection->generateId();

    server.replyQueryExtension(false, 0);
    try {
        connection->generateId();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.getKind(), ConnectionError::Kind::IdsExhausted);
    }
}

TEST(ConnectionTest, CheckRequestFindsQueuedError) {
    FakeServer server;
    auto connection = server.connect();

    protocol::MapWindowRequest map{};
    map.window = 0xbad;
    auto sequence = connection->send(map);

    server.error(protocol::ErrorCode::Window, sequence, protocol::opcode::MapWindow, 0xbad);
    server.replyInputFocus();

    auto error = connection->checkRequest(sequence);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->error_code, static_cast<std::uint8_t>(protocol::ErrorCode::Window));
    EXPECT_EQ(error->bad_value, 0xbadu);
    EXPECT_FALSE(connection->hasPendingFrames());
}

TEST(ConnectionTest, CheckRequestWithoutError) {
    FakeServer server;
    auto connection = server.connect();

    protocol::MapWindowRequest map{};
    map.window = 0x400001;
    auto sequence = connection->send(map);

    server.replyInputFocus();
    EXPECT_FALSE(connection->checkRequest(sequence).has_value());

    auto requests = server.takeRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].opcode(), protocol::opcode::GetInputFocus);
}

TEST(ConnectionTest, InternAtomSendsName) {
    FakeServer server;
    auto connection = server.connect();

    server.replyInternAtom(301);
    EXPECT_EQ(connection->internAtom("WM_PROTOCOLS"), 301u);

    auto requests = server.takeRequests();
    ASSERT_EQ(requests.size(), 1u);
    auto request = requests[0].as<protocol::InternAtomRequest>();
    EXPECT_EQ(request.name_len, 12);
    EXPECT_EQ(request.length, 5);
    EXPECT_EQ(requests[0].tail(sizeof(protocol::InternAtomRequest), 12), "WM_PROTOCOLS");
}

TEST(ConnectionTest, EventsBeforeReplyAreQueuedInOrder) {
    FakeServer server;
    auto connection = server.connect();

    protocol::MapRequestEvent first{};
    first.response_type = static_cast<std::uint8_t>(protocol::EventCode::MapRequest);
    first.window = 0x111;
    protocol::DestroyNotifyEvent second{};
    second.response_type = static_cast<std::uint8_t>(protocol::EventCode::DestroyNotify);
    second.window = 0x222;

    server.writeRecord(first);
    server.writeRecord(second);
    server.replyInternAtom(5);

    EXPECT_EQ(connection->internAtom("FOO"), 5u);
    EXPECT_TRUE(connection->hasPendingFrames());

    auto event = protocol::decodeEvent(connection->readFrame());
    ASSERT_TRUE(std::holds_alternative<protocol::MapRequestEvent>(event));
    EXPECT_EQ(std::get<protocol::MapRequestEvent>(event).window, 0x111u);

    event = protocol::decodeEvent(connection->readFrame());
    ASSERT_TRUE(std::holds_alternative<protocol::DestroyNotifyEvent>(event));
    EXPECT_EQ(std::get<protocol::DestroyNotifyEvent>(event).window, 0x222u);

    EXPECT_FALSE(connection->hasPendingFrames());
}

TEST(ConnectionTest, ErrorForAwaitedRequestThrows) {
    FakeServer server;
    auto connection = server.connect();

    server.error(protocol::ErrorCode::Atom, 1, protocol::opcode::InternAtom);
    try {
        connection->internAtom("BROKEN");
        FAIL() << "expected RequestError";
    } catch (const protocol::RequestError& e) {
        EXPECT_EQ(e.getCode(), protocol::ErrorCode::Atom);
    }
}

TEST(ConnectionTest, ClosedSocketIsReported) {
    FakeServer server;
    auto connection = server.connect();
    server.closeServerEnd();

    try {
        connection->readFrame();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.getKind(), ConnectionError::Kind::Io);
    }
    EXPECT_EQ(connection->getStatus(), Connection::Status::Closed);
}
