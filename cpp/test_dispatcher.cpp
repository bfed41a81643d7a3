#include "umpcore/compression.hpp"
#include "umpcore/dispatcher.hpp"
#include "umpcore/errors.hpp"
#include "umpcore/onesie.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>

namespace umpcore::test {
namespace {

Part MakePartValue(PartType type, Bytes payload) {
    Part part;
    part.type = ToWire(type);
    part.payload = std::move(payload);
    return part;
}

struct SealedOnesie {
    Part header;
    Part data;
};

SealedOnesie SealOnesie(std::uint32_t header_type, const Bytes& key, const Bytes& plaintext) {
    onesie::SealedPayload sealed = onesie::Seal(key, compression::GzipCompress(plaintext));
    TestCryptoParams params{sealed.hmac, sealed.iv, 1u};
    return SealedOnesie{MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(header_type, params)),
                        MakePartValue(PartType::kOnesieData, sealed.ciphertext)};
}

ErrorKind KindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const UmpError& err) {
        return err.kind();
    }
    ADD_FAILURE() << "expected UmpError";
    return ErrorKind::kCryptoFailure;
}

class DispatcherTest : public ::testing::Test {
protected:
    Bytes key_ = OnesieKey();
    ProtoSchemaDecoder decoder_;
};

TEST_F(DispatcherTest, PlayerResponseConsumesPendingHeader) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    SealedOnesie onesie = SealOnesie(0, key_, InnertubeWrapper(1, 200, Text("{\"playabilityStatus\":{}}")));

    std::vector<Event> events = dispatcher.Dispatch(onesie.header);
    ASSERT_EQ(events.size(), 1u);
    const auto* header = events[0].As<OnesieHeaderEvent>();
    ASSERT_NE(header, nullptr);
    EXPECT_TRUE(header->awaiting_data);
    EXPECT_EQ(header->header.video_id, "dQw4w9WgXcQ");
    EXPECT_EQ(header->header.itag, "251");
    EXPECT_TRUE(dispatcher.HasPendingHeader());

    events = dispatcher.Dispatch(onesie.data);
    ASSERT_EQ(events.size(), 1u);
    const auto* response = events[0].As<PlayerResponse>();
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->response.http_status, 200);
    EXPECT_EQ(response->response.body, Text("{\"playabilityStatus\":{}}"));
    EXPECT_FALSE(dispatcher.HasPendingHeader());
}

TEST_F(DispatcherTest, UpstreamFailureIsAnEvent) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    SealedOnesie onesie = SealOnesie(0, key_, InnertubeWrapper(1, 500, Text("backend error")));
    dispatcher.Dispatch(onesie.header);
    std::vector<Event> events = dispatcher.Dispatch(onesie.data);
    ASSERT_EQ(events.size(), 1u);
    const auto* failure = events[0].As<UpstreamFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->http_status, 500);
    EXPECT_EQ(failure->proxy_status, 1u);
    EXPECT_EQ(failure->body, Text("backend error"));

    events = dispatcher.Dispatch(MakePartValue(PartType::kSabrError, Text("x")));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].Is<OpaquePart>());
}

TEST_F(DispatcherTest, EncryptedInnertubeResponsePart) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    SealedOnesie onesie = SealOnesie(25, key_, Text("next response"));
    dispatcher.Dispatch(onesie.header);
    std::vector<Event> events = dispatcher.Dispatch(onesie.data);
    ASSERT_EQ(events.size(), 1u);
    const auto* part = events[0].As<InnertubeResponsePart>();
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->plaintext, Text("next response"));
}

TEST_F(DispatcherTest, StandaloneHeadersNeverWaitForData) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    for (std::uint32_t type : {6u, 14u, 16u}) {
        std::vector<Event> events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(type)));
        ASSERT_EQ(events.size(), 1u);
        EXPECT_FALSE(events[0].As<OnesieHeaderEvent>()->awaiting_data);
        EXPECT_FALSE(dispatcher.HasPendingHeader());
    }
    EXPECT_EQ(KindOf([&] { dispatcher.Dispatch(MakePartValue(PartType::kOnesieData, Text("orphan"))); }),
              ErrorKind::kProtocolViolation);
}

TEST_F(DispatcherTest, StandaloneHeaderWhileDataPendingIsLogged) {
    LogCapture capture;
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    SealedOnesie onesie = SealOnesie(25, key_, Text("still paired"));
    dispatcher.Dispatch(onesie.header);
    std::vector<Event> events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(6)));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0].As<OnesieHeaderEvent>()->awaiting_data);
    EXPECT_NE(capture.str().find("still waiting for its data"), std::string::npos);
    EXPECT_TRUE(dispatcher.HasPendingHeader());

    events = dispatcher.Dispatch(onesie.data);
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].Is<InnertubeResponsePart>());
    EXPECT_EQ(events[0].As<InnertubeResponsePart>()->plaintext, Text("still paired"));
}

TEST_F(DispatcherTest, SecondPendingHeaderIsViolation) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(0)));
    EXPECT_EQ(KindOf([&] { dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(25))); }),
              ErrorKind::kProtocolViolation);
}

TEST_F(DispatcherTest, LenientModeReplacesPendingHeader) {
    Config config;
    config.lenient = true;
    Dispatcher dispatcher(config, decoder_, &key_);
    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(0)));
    SealedOnesie onesie = SealOnesie(25, key_, Text("kept"));
    dispatcher.Dispatch(onesie.header);
    std::vector<Event> events = dispatcher.Dispatch(onesie.data);
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].Is<InnertubeResponsePart>());

    events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieData, Text("orphan")));
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].Is<OpaquePart>());
    EXPECT_EQ(events[0].As<OpaquePart>()->payload, Text("orphan"));
}

TEST_F(DispatcherTest, UnrecognizedHeaderTypePassesDataThrough) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(9)));
    // an unrecognized pending header is replaced without complaint
    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(9)));
    std::vector<Event> events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieData, Text("blob")));
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].Is<OpaquePart>());
    EXPECT_EQ(events[0].part_type, ToWire(PartType::kOnesieData));
}

TEST_F(DispatcherTest, OnesieDataNeedsKeyAndParams) {
    Dispatcher keyless(Config{}, decoder_, nullptr);
    SealedOnesie onesie = SealOnesie(0, key_, InnertubeWrapper(1, 200, Text("{}")));
    keyless.Dispatch(onesie.header);
    EXPECT_EQ(KindOf([&] { keyless.Dispatch(onesie.data); }), ErrorKind::kMissingCryptoParams);
    EXPECT_FALSE(keyless.HasPendingHeader());

    Dispatcher dispatcher(Config{}, decoder_, &key_);
    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(0)));
    EXPECT_EQ(KindOf([&] { dispatcher.Dispatch(onesie.data); }), ErrorKind::kMissingCryptoParams);
}

TEST_F(DispatcherTest, TamperedOnesieDataFailsAuthentication) {
    Dispatcher dispatcher(Config{}, decoder_, &key_);
    SealedOnesie onesie = SealOnesie(0, key_, InnertubeWrapper(1, 200, Text("{}")));
    onesie.data.payload[0] ^= 0x01;
    dispatcher.Dispatch(onesie.header);
    EXPECT_EQ(KindOf([&] { dispatcher.Dispatch(onesie.data); }), ErrorKind::kAuthenticationFailed);
}

TEST_F(DispatcherTest, MediaKeyDrainsQueuedEncryptedMedia) {
    const Bytes media_key = Pattern(16, 21);
    const Bytes plaintext = Pattern(48, 3);
    const Bytes ciphertext = ZeroIvCtr(media_key, plaintext);

    Dispatcher dispatcher(Config{}, decoder_, &key_);
    std::vector<Event> events = dispatcher.Dispatch(MakePartValue(PartType::kMediaHeader, MediaHeaderPayload(4)));
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].Is<MediaHeaderEvent>());
    EXPECT_EQ(events[0].As<MediaHeaderEvent>()->header.header_id, 4u);
    EXPECT_EQ(events[0].As<MediaHeaderEvent>()->header.itag.value_or(0), 251);

    events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieEncryptedMedia,
                                               Tagged(4, Bytes(ciphertext.begin(), ciphertext.begin() + 20))));
    EXPECT_TRUE(events.empty());

    dispatcher.Dispatch(MakePartValue(PartType::kOnesieHeader, OnesieHeaderPayload(2)));
    events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieData, media_key));
    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(events[0].Is<MediaKeyUpdate>());
    EXPECT_EQ(events[0].As<MediaKeyUpdate>()->key_size, 16u);
    ASSERT_TRUE(events[1].Is<MediaChunk>());
    EXPECT_EQ(events[1].part_type, ToWire(PartType::kOnesieEncryptedMedia));
    EXPECT_EQ(events[1].As<MediaChunk>()->data, Bytes(plaintext.begin(), plaintext.begin() + 20));

    events = dispatcher.Dispatch(MakePartValue(PartType::kOnesieEncryptedMedia,
                                               Tagged(4, Bytes(ciphertext.begin() + 20, ciphertext.end()))));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].As<MediaChunk>()->data, Bytes(plaintext.begin() + 20, plaintext.end()));

    events = dispatcher.Dispatch(MakePartValue(PartType::kMediaEnd, Tagged(4)));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].As<MediaEnd>()->total_bytes, plaintext.size());
    std::vector<CompletedMedia> done = dispatcher.assembler().TakeCompleted();
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].data, plaintext);
}

TEST_F(DispatcherTest, UnknownPartTypesStayOpaque) {
    Dispatcher dispatcher(Config{}, decoder_, nullptr);
    const Bytes payload = Pattern(33, 8);
    for (std::uint32_t type : {0u, 35u, 58u, 200u, 0xFFFFFFF0u}) {
        Part part;
        part.type = type;
        part.payload = payload;
        std::vector<Event> events = dispatcher.Dispatch(part);
        ASSERT_EQ(events.size(), 1u);
        EXPECT_EQ(events[0].part_type, type);
        ASSERT_TRUE(events[0].Is<OpaquePart>());
        EXPECT_EQ(events[0].As<OpaquePart>()->payload, payload);
    }
}

}  // namespace
}  // namespace umpcore::test
