#include <gtest/gtest.h>

#include "errors.hpp"
#include "framed_call.hpp"
#include "message.hpp"
#include "msgpack_codec.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>

using namespace dtnclient;

namespace {

Message register_request() {
    return RegisterUnregister(MessageType::RegisterEID, Eid::dtn("node1", "mailbox"));
}

std::string error_of(const std::string& incoming) {
    auto record = std::make_shared<ScriptRecord>();
    try {
        call(scripted_factory(incoming, record), register_request());
    } catch (const Error& exc) {
        return exc.what();
    }
    return "";
}

} // namespace

class FramedCallTest : public ::testing::Test {
protected:
    void SetUp() override { codec::set_dump_directory(dumps_.path()); }
    void TearDown() override { codec::set_dump_directory({}); }

    TempDir dumps_;
};

TEST(LengthPrefix, IsEightBytesBigEndian) {
    std::string prefix = encode_length_prefix(0x0102030405060708ULL);
    EXPECT_EQ(prefix, std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
    EXPECT_EQ(decode_length_prefix(prefix.data()), 0x0102030405060708ULL);

    EXPECT_EQ(encode_length_prefix(5), std::string("\x00\x00\x00\x00\x00\x00\x00\x05", 8));
}

TEST_F(FramedCallTest, RequestIsWrittenAsOneFrame) {
    auto record = std::make_shared<ScriptRecord>();
    Message reply = call(scripted_factory(frame_message(Response(MessageType::Response, "")), record),
                         register_request());

    EXPECT_EQ(record->written, frame_message(register_request()));
    ASSERT_GE(record->written.size(), kLengthPrefixSize);
    EXPECT_EQ(decode_length_prefix(record->written.data()), record->written.size() - kLengthPrefixSize);

    ASSERT_TRUE(std::holds_alternative<Response>(reply));
    EXPECT_EQ(std::get<Response>(reply).error(), "");
}

TEST_F(FramedCallTest, EachCallOpensAndClosesItsOwnConnection) {
    auto record = std::make_shared<ScriptRecord>();
    auto factory = scripted_factory(frame_message(Response(MessageType::Response, "")), record);

    call(factory, register_request());
    call(factory, register_request());

    EXPECT_EQ(record->opened, 2);
    EXPECT_EQ(record->closed, 2);
}

TEST_F(FramedCallTest, ZeroLengthIsRejected) {
    std::string message = error_of(encode_length_prefix(0));
    EXPECT_NE(message.find("nonsensical data-length: 0"), std::string::npos) << message;
    EXPECT_THROW(call(scripted_factory(encode_length_prefix(0), std::make_shared<ScriptRecord>()),
                      register_request()),
                 DataError);
}

TEST_F(FramedCallTest, ShortBodyNamesBothLengths) {
    std::string incoming = encode_length_prefix(100) + std::string(40, 'x');
    EXPECT_THROW(call(scripted_factory(incoming, std::make_shared<ScriptRecord>()), register_request()), DataError);

    std::string message = error_of(incoming);
    EXPECT_NE(message.find("announced: 100"), std::string::npos) << message;
    EXPECT_NE(message.find("actual: 40"), std::string::npos) << message;
}

TEST_F(FramedCallTest, TruncatedPrefixIsRejected) {
    EXPECT_THROW(call(scripted_factory(std::string("\x00\x00\x00", 3), std::make_shared<ScriptRecord>()),
                      register_request()),
                 DataError);
    EXPECT_THROW(call(scripted_factory("", std::make_shared<ScriptRecord>()), register_request()), DataError);
}

TEST_F(FramedCallTest, RequestReplyIsRejected) {
    std::string incoming = frame_message(ListBundles(MessageType::ListBundles, Eid::dtn("n", "m"), false));
    EXPECT_THROW(call(scripted_factory(incoming, std::make_shared<ScriptRecord>()), register_request()), DataError);

    std::string message = error_of(incoming);
    EXPECT_NE(message.find("not a response message"), std::string::npos) << message;
    EXPECT_NE(message.find("ListBundles"), std::string::npos) << message;
}

TEST_F(FramedCallTest, DaemonErrorIsRaisedWithItsText) {
    std::string incoming = frame_message(ListResponse(MessageType::ListResponse, "no such mailbox", {}));
    try {
        call(scripted_factory(incoming, std::make_shared<ScriptRecord>()), register_request());
        FAIL() << "expected DaemonError";
    } catch (const DaemonError& exc) {
        EXPECT_STREQ(exc.what(), "no such mailbox");
    }
}

TEST_F(FramedCallTest, UndecodableReplyClosesConnection) {
    auto record = std::make_shared<ScriptRecord>();
    std::string incoming = frame(pack_raw([](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(1);
        pk.pack(std::string("Type"));
        pk.pack(999);
    }));

    EXPECT_THROW(call(scripted_factory(incoming, record), register_request()), InvalidMessageError);
    EXPECT_EQ(record->opened, 1);
    EXPECT_EQ(record->closed, 1);
}

TEST_F(FramedCallTest, NullFactoryResultIsTransportError) {
    ConnectionFactory factory = []() { return std::unique_ptr<Connection>(); };
    EXPECT_THROW(call(factory, register_request()), TransportError);
}

TEST(ReadFrame, ReassemblesChunkedBody) {
    std::string body(70000, 'z');
    ScriptedConnection connection(frame(body), std::make_shared<ScriptRecord>(), 4096);
    EXPECT_EQ(read_frame(connection), body);
}

TEST(Expect, ReturnsMatchingVariant) {
    Message reply = ListResponse(MessageType::ListResponse, "", {"b1"});
    EXPECT_EQ(expect<ListResponse>(reply).bundle_ids(), std::vector<std::string>{"b1"});
}

TEST(Expect, MismatchNamesBothTypes) {
    Message reply = Response(MessageType::Response, "");
    try {
        expect<ListResponse>(reply);
        FAIL() << "expected DataError";
    } catch (const DataError& exc) {
        EXPECT_STREQ(exc.what(), "response should have been ListResponse, was Response");
    }
}
