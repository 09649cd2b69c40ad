#include <gtest/gtest.h>
#include "realtime/Envelope.hpp"
#include "realtime/WebSocketLink.hpp"
#include "util/hash.hpp"

#include <nlohmann/json.hpp>

using namespace tandem::realtime;
using namespace tandem::sync::model;
using json = nlohmann::json;

TEST(EnvelopeTest, ItemCarriesTheWholeSyncItem) {
    const SyncItem item{"m1", DataType::MemoryRecord, Operation::Create, R"({"content":"hi"})", 1234};
    const auto wire = json::parse(encode(ItemMsg{item}));
    ASSERT_TRUE(wire.contains("item"));
    EXPECT_EQ(wire["item"]["data_type"], "memory_record");
    EXPECT_EQ(wire["item"]["checksum"], item.checksum);

    const auto decoded = decode(wire.dump());
    ASSERT_TRUE(std::holds_alternative<ItemMsg>(decoded));
    EXPECT_EQ(std::get<ItemMsg>(decoded).item, item);
}

TEST(EnvelopeTest, ChecksumCoversPayloadOnly) {
    SyncItem item{"m1", DataType::MemoryRecord, Operation::Create, R"({"content":"hi"})", 1234};
    EXPECT_EQ(item.checksum, tandem::util::sha256Hex(item.payload));

    item.timestamp = 9999;
    EXPECT_TRUE(item.checksumMatches());
    item.payload = R"({"content":"changed"})";
    EXPECT_FALSE(item.checksumMatches());
}

TEST(EnvelopeTest, DecodesEachKind) {
    const auto ack = decode(R"({"ack":{"item_id":"m1","success":false}})");
    ASSERT_TRUE(std::holds_alternative<Ack>(ack));
    EXPECT_EQ(std::get<Ack>(ack).item_id, "m1");
    EXPECT_FALSE(std::get<Ack>(ack).success);

    const auto hb = decode(R"({"heartbeat":{"timestamp":99}})");
    ASSERT_TRUE(std::holds_alternative<Heartbeat>(hb));
    EXPECT_EQ(std::get<Heartbeat>(hb).timestamp, 99);
    EXPECT_EQ(std::get<Heartbeat>(hb).health, "ok");

    const auto err = decode(R"({"error":{"code":"AUTH","message":"token expired","recoverable":false}})");
    ASSERT_TRUE(std::holds_alternative<Error>(err));
    EXPECT_EQ(std::get<Error>(err).code, "AUTH");
    EXPECT_FALSE(std::get<Error>(err).recoverable);
}

TEST(EnvelopeTest, ReceiverMatchesExhaustively) {
    int seen = 0;
    for (const auto& text : {encode(Ack{"a", true}), encode(Heartbeat{1, "ok"}), encode(Error{"X", "y", true})}) {
        std::visit(overloaded{
            [&](const ItemMsg&) { seen += 1; },
            [&](const Ack&) { seen += 10; },
            [&](const Heartbeat&) { seen += 100; },
            [&](const Error&) { seen += 1000; }
        }, decode(text));
    }
    EXPECT_EQ(seen, 1110);
}

TEST(EnvelopeTest, RejectsMalformedFrames) {
    EXPECT_THROW(decode("not json"), MalformedEnvelope);
    EXPECT_THROW(decode("[1,2]"), MalformedEnvelope);
    EXPECT_THROW(decode("{}"), MalformedEnvelope);
    EXPECT_THROW(decode(R"({"ack":{"item_id":"a","success":true},"heartbeat":{"timestamp":1}})"), MalformedEnvelope);
    EXPECT_THROW(decode(R"({"telemetry":{}})"), MalformedEnvelope);
    EXPECT_THROW(decode(R"({"ack":{"success":true}})"), MalformedEnvelope);
    EXPECT_THROW(decode(R"({"item":{"id":"a","data_type":"bogus","operation":"create","payload":"","timestamp":1}})"),
                 MalformedEnvelope);
}

TEST(WebSocketLinkTest, ParsesRealtimeUrls) {
    const auto secure = WebSocketLink::parseUrl("wss://sync.example.com/api/v1/realtime");
    EXPECT_TRUE(secure.secure);
    EXPECT_EQ(secure.host, "sync.example.com");
    EXPECT_EQ(secure.port, "443");
    EXPECT_EQ(secure.target, "/api/v1/realtime");

    const auto plain = WebSocketLink::parseUrl("ws://localhost:8080");
    EXPECT_FALSE(plain.secure);
    EXPECT_EQ(plain.host, "localhost");
    EXPECT_EQ(plain.port, "8080");
    EXPECT_EQ(plain.target, "/");

    EXPECT_THROW(WebSocketLink::parseUrl("https://sync.example.com"), std::invalid_argument);
    EXPECT_THROW(WebSocketLink::parseUrl("ws:///path"), std::invalid_argument);
}
