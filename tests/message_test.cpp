#include <gtest/gtest.h>
#include "protocol/message.hpp"
#include "protocol/errors.hpp"
#include "protocol/serializer.hpp"
#include <nlohmann/json.hpp>
#include <cstring>

using namespace protocol;

namespace {

Bytes all_byte_values() {
    Bytes bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<uint8_t>(i));
    }
    return bytes;
}

File sample_file() {
    return File{"docs/readme.txt", "readme.txt", 12, "ab12"};
}

Dir sample_dir() {
    Dir docs{"docs", "docs", "d1", {sample_file()}, {}};
    return Dir{"", "root", "r0", {File{"a.bin", "a.bin", 3, "ff00"}}, {docs}};
}

} // namespace

TEST(MessageTest, IdentityRequestRoundTrip) {
    Request request{"alice", TYPE_IDENTITY, {}};
    Request decoded = Request::from_text(request.to_text());
    EXPECT_EQ(decoded.username, "alice");
    EXPECT_EQ(decoded.data_type, "IDENTITY");
    EXPECT_TRUE(decoded.data.empty());
    EXPECT_EQ(decoded, request);
}

TEST(MessageTest, DenyResponseRoundTrip) {
    Response response{STATUS_BAD, MESSAGE_DENY, {}};
    Response decoded = Response::from_text(response.to_text());
    EXPECT_EQ(decoded.status, 400);
    EXPECT_EQ(decoded.message, "DENY");
    EXPECT_EQ(decoded, response);
}

TEST(MessageTest, BinaryDataSurvivesText) {
    Bytes data = all_byte_values();
    data.push_back(BYTE_DELIM);
    data.push_back(0);

    Request request{"bob", TYPE_FILE, data};
    EXPECT_EQ(Request::from_text(request.to_text()), request);

    Response response{STATUS_OK, MESSAGE_ACCEPT, data};
    EXPECT_EQ(Response::from_text(response.to_text()), response);
}

TEST(MessageTest, UsesWireFieldNamesAndBase64) {
    Request request{"carol", TYPE_DIGEST, Bytes{'h', 'i'}};
    auto j = nlohmann::json::parse(request.to_text());
    EXPECT_EQ(j.at("Username"), "carol");
    EXPECT_EQ(j.at("DataType"), "DIGEST");
    EXPECT_EQ(j.at("Data"), "aGk=");

    Response response{STATUS_OK, MESSAGE_ACCEPT, {}};
    auto r = nlohmann::json::parse(response.to_text());
    EXPECT_EQ(r.at("Status"), 200);
    EXPECT_EQ(r.at("Message"), "ACCEPT");
    EXPECT_EQ(r.at("Data"), "");
}

TEST(MessageTest, NullDataDecodesAsEmpty) {
    Request decoded = Request::from_text(R"({"Username":"dave","DataType":"IDENTITY","Data":null})");
    EXPECT_TRUE(decoded.data.empty());
}

TEST(MessageTest, MalformedTextThrows) {
    EXPECT_THROW(Request::from_text("not json"), MalformedEnvelope);
    EXPECT_THROW(Request::from_text("[1,2]"), MalformedEnvelope);
    EXPECT_THROW(Request::from_text(R"({"Username":"x","Data":""})"), MalformedEnvelope);
    EXPECT_THROW(Request::from_text(R"({"Username":1,"DataType":"FILE","Data":""})"), MalformedEnvelope);
    EXPECT_THROW(Request::from_text(R"({"Username":"x","DataType":"FILE","Data":"%%%"})"), MalformedEnvelope);
    EXPECT_THROW(Response::from_text(R"({"Status":"200","Message":"ACCEPT","Data":""})"), MalformedEnvelope);
    EXPECT_THROW(Response::from_text(R"({"Message":"ACCEPT","Data":""})"), MalformedEnvelope);
}

TEST(MessageTest, StatusOutsideIntRangeThrows) {
    EXPECT_THROW(Response::from_text(R"({"Status":4294967496,"Message":"ACCEPT","Data":""})"), MalformedEnvelope);
    EXPECT_THROW(Response::from_text(R"({"Status":18446744073709551615,"Message":"ACCEPT","Data":""})"), MalformedEnvelope);
    EXPECT_THROW(Response::from_text(R"({"Status":-2147483649,"Message":"DENY","Data":""})"), MalformedEnvelope);
    EXPECT_EQ(Response::from_text(R"({"Status":2147483647,"Message":"","Data":""})").status, 2147483647);
    EXPECT_EQ(Response::from_text(R"({"Status":-2147483648,"Message":"","Data":""})").status, -2147483647 - 1);
}

TEST(MessageTest, Base64RoundTrip) {
    EXPECT_EQ(to_base64(Bytes{}), "");
    EXPECT_EQ(to_base64(Bytes{'f', 'o', 'o'}), "Zm9v");
    EXPECT_EQ(from_base64("Zm9vYg=="), (Bytes{'f', 'o', 'o', 'b'}));
    EXPECT_EQ(from_base64(to_base64(all_byte_values())), all_byte_values());
    EXPECT_THROW(from_base64("Zm9"), MalformedEnvelope);
}

TEST(MessageTest, PayloadTags) {
    EXPECT_EQ(data_type_of(IdentityRequest{"a"}), "IDENTITY");
    EXPECT_EQ(data_type_of(DigestRequest{}), "DIGEST");
    EXPECT_EQ(data_type_of(SyncRequest{}), "SYNC-REQUEST");
    EXPECT_EQ(data_type_of(FileRequest{}), "FILE");
}

TEST(MessageTest, PayloadsRoundTripThroughRequest) {
    std::vector<Payload> payloads = {
        IdentityRequest{"erin"},
        DigestRequest{sample_dir()},
        SyncRequest{SyncAction::DELETE, sample_file()},
        FileRequest{sample_file(), all_byte_values()},
    };
    for (const auto& payload : payloads) {
        Request request = make_request("erin", payload);
        EXPECT_EQ(request.data_type, data_type_of(payload));

        Request decoded = Request::from_text(request.to_text());
        EXPECT_EQ(decode_payload(decoded), payload);
    }
}

TEST(MessageTest, SubPayloadFieldNames) {
    auto sync = nlohmann::json::parse(encode_payload(SyncRequest{SyncAction::UPDATE, sample_file()}));
    EXPECT_EQ(sync.at("Action"), "UPDATE");
    EXPECT_EQ(sync.at("File").at("Path"), "docs/readme.txt");
    EXPECT_EQ(sync.at("File").at("Size"), 12);

    auto digest = nlohmann::json::parse(encode_payload(DigestRequest{sample_dir()}));
    EXPECT_EQ(digest.at("Dir").at("Dirs").at(0).at("Files").at(0).at("Name"), "readme.txt");
}

TEST(MessageTest, DecodePayloadRejectsMismatch) {
    Bytes identity = encode_payload(IdentityRequest{"frank"});
    EXPECT_THROW(decode_payload("UNKNOWN", identity), MalformedEnvelope);
    EXPECT_THROW(decode_payload(TYPE_DIGEST, identity), MalformedEnvelope);
    EXPECT_THROW(decode_payload(TYPE_SYNC_REQUEST, identity), MalformedEnvelope);
    EXPECT_THROW(decode_payload(TYPE_FILE, Bytes{'{', '}'}), MalformedEnvelope);
    EXPECT_THROW(decode_payload(TYPE_IDENTITY, Bytes{'x'}), MalformedEnvelope);
}

TEST(MessageTest, UnknownSyncActionThrows) {
    auto text = R"({"Action":"RENAME","File":{"Path":"a","Name":"a","Size":0,"Digest":""}})";
    EXPECT_THROW(decode_payload(TYPE_SYNC_REQUEST, Bytes(text, text + std::strlen(text))), MalformedEnvelope);
}

TEST(MessageTest, DecodeRequestStripsPacketPadding) {
    Request request = make_request("grace", FileRequest{sample_file(), Bytes(3000, 0)});
    Bytes buffer = deserialize(serialize(request.to_text()));
    ASSERT_GT(buffer.size(), request.to_text().size());
    EXPECT_EQ(decode_request(buffer), request);

    Response response{STATUS_OK, MESSAGE_ACCEPT, Bytes{0, 0, BYTE_DELIM, 0}};
    EXPECT_EQ(decode_response(deserialize(serialize(response.to_text()))), response);
}

TEST(MessageTest, DebugRendering) {
    Request request{"heidi", TYPE_IDENTITY, Bytes{'o', 'k'}};
    EXPECT_EQ(to_string(request), "Username: heidi\nDataType: IDENTITY\nData: ok\n");

    Response response{STATUS_BAD, MESSAGE_DENY, Bytes{0, 1, 2}};
    EXPECT_EQ(to_string(response), "Status: 400\nMessage: DENY\nData: <3 bytes>\n");
}
