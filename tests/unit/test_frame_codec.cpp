#include <gtest/gtest.h>
#include "lobbylink/core/error.hpp"
#include "lobbylink/transport/frame_codec.hpp"

using namespace lobbylink;
using namespace lobbylink::transport;

TEST(TransferFrameTest, ChunkLayoutIsLittleEndian) {
    auto frame = TransferFrame::chunk("ab", 3, 0x01020304, {0xAA, 0xBB});
    auto bytes = frame.serialize();

    const std::vector<std::uint8_t> expected{
        0x00, 0x00, 0x00, 0x00,   // type CHUNK
        0x02, 0x00, 0x00, 0x00,   // id length
        'a', 'b',
        0x03, 0x00, 0x00, 0x00,   // chunk index
        0x04, 0x03, 0x02, 0x01,   // total chunks
        0xAA, 0xBB};
    EXPECT_EQ(bytes, expected);
}

TEST(TransferFrameTest, CompleteAndErrorFrames) {
    auto complete = TransferFrame::complete("transfer-1-thread2").serialize();
    ASSERT_EQ(complete.size(), FRAME_HEADER_SIZE + 18);
    EXPECT_EQ(complete[0], 0x01);

    auto parsed = TransferFrame::deserialize(complete);
    EXPECT_EQ(parsed.type, FrameType::COMPLETE);
    EXPECT_EQ(parsed.request_id, "transfer-1-thread2");
    EXPECT_TRUE(parsed.payload.empty());

    auto error = TransferFrame::deserialize(TransferFrame::error("t", "File not found").serialize());
    EXPECT_EQ(error.type, FrameType::ERROR);
    EXPECT_EQ(error.error_message(), "File not found");
}

TEST(TransferFrameTest, ChunkSurvivesDecoding) {
    std::vector<std::uint8_t> data(1000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7);
    }
    auto frame = TransferFrame::deserialize(TransferFrame::chunk("transfer-9-thread11", 4, 5, data).serialize());

    EXPECT_EQ(frame.type, FrameType::CHUNK);
    EXPECT_EQ(frame.request_id, "transfer-9-thread11");
    EXPECT_EQ(frame.chunk_index, 4u);
    EXPECT_EQ(frame.total_chunks, 5u);
    EXPECT_EQ(frame.payload, data);
}

TEST(TransferFrameTest, RejectsMalformedFrames) {
    std::vector<std::uint8_t> too_short{0x00, 0x00};
    EXPECT_THROW(TransferFrame::deserialize(too_short), core::ProtocolError);

    std::vector<std::uint8_t> unknown_type{0x09, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_THROW(TransferFrame::deserialize(unknown_type), core::ProtocolError);

    std::vector<std::uint8_t> id_overrun{0x01, 0, 0, 0, 0x10, 0, 0, 0, 'x'};
    EXPECT_THROW(TransferFrame::deserialize(id_overrun), core::ProtocolError);

    std::vector<std::uint8_t> huge_id{0x01, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0x7F};
    EXPECT_THROW(TransferFrame::deserialize(huge_id), core::ProtocolError);

    auto truncated_chunk = TransferFrame::chunk("id", 0, 1, {}).serialize();
    truncated_chunk.resize(truncated_chunk.size() - 2);
    EXPECT_THROW(TransferFrame::deserialize(truncated_chunk), core::ProtocolError);

    auto bad_index = TransferFrame::chunk("id", 5, 5, {1}).serialize();
    EXPECT_THROW(TransferFrame::deserialize(bad_index), core::ProtocolError);
}
