#include <vector>

#include "frame_codec.hpp"
#include "update_frame.hpp"
#include "crc32.hpp"
#include "error.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(FrameCodec)
{
	FrameDecoder *decoder;

	void setup() {
		decoder = new FrameDecoder;
	}

	void teardown() {
		delete decoder;
	}

	// Feeds bytes and collects every frame that completes
	std::vector<Frame> feed_all(const std::vector<uint8_t> &bytes) {
		std::vector<Frame> frames;
		Frame frame;
		for (uint8_t b : bytes) {
			if (decoder->feed(b, frame))
				frames.push_back(frame);
		}
		return frames;
	}
};

TEST(FrameCodec, EncodeLayout)
{
	std::vector<uint8_t> chunk = { 0x10, 0x20, 0x30 };
	std::vector<uint8_t> wire = FrameCodec::encode(Frame::data(0x01020304, chunk));

	CHECK_EQUAL(FrameCodec::HEADER_SIZE + 3 + FrameCodec::TRAILER_SIZE, wire.size());
	CHECK_EQUAL(0xA5, wire[0]);
	CHECK_EQUAL(2, wire[1]);
	CHECK_EQUAL(0x04, wire[2]);
	CHECK_EQUAL(0x03, wire[3]);
	CHECK_EQUAL(0x02, wire[4]);
	CHECK_EQUAL(0x01, wire[5]);
	CHECK_EQUAL(3, wire[6]);
	CHECK_EQUAL(0, wire[7]);
	CHECK_EQUAL(0x10, wire[8]);
	CHECK_EQUAL(0x30, wire[10]);

	uint32_t crc = CRC32::checksum(&wire[1], 10);
	CHECK_EQUAL(crc & 0xFF, wire[11]);
	CHECK_EQUAL(crc >> 24, wire[14]);
}

TEST(FrameCodec, HelloCarriesSizeAndToken)
{
	Frame hello = Frame::hello(4128, 0xCAFEF00D);
	CHECK_TRUE(FrameKind::HELLO == hello.kind);
	CHECK_EQUAL(8, hello.payload.size());

	uint32_t size, token;
	CHECK_TRUE(hello.hello_params(size, token));
	CHECK_EQUAL(4128, size);
	CHECK_EQUAL(0xCAFEF00D, token);

	Frame short_hello = hello;
	short_hello.payload.pop_back();
	CHECK_FALSE(short_hello.hello_params(size, token));
	CHECK_FALSE(Frame::ack(1).hello_params(size, token));
}

TEST(FrameCodec, HelloFlagsAreOptional)
{
	uint32_t size, token, flags = 0xFFFFFFFF;
	CHECK_TRUE(Frame::hello(4128, 7).hello_params(size, token, flags));
	CHECK_EQUAL(0, flags);

	Frame hello = Frame::hello(4128, 7, HELLO_FLAG_LZ4);
	CHECK_EQUAL(12, hello.payload.size());
	CHECK_TRUE(hello.hello_params(size, token, flags));
	CHECK_EQUAL(HELLO_FLAG_LZ4, flags);
	CHECK_EQUAL(4128, size);
	CHECK_EQUAL(7, token);

	// Older callers still see size and token
	CHECK_TRUE(hello.hello_params(size, token));

	hello.payload.pop_back();
	CHECK_FALSE(hello.hello_params(size, token, flags));
}

TEST(FrameCodec, NackCarriesReason)
{
	CHECK_TRUE(NackReason::OUT_OF_WINDOW == Frame::nack(9, NackReason::OUT_OF_WINDOW).nack_reason());
	CHECK_TRUE(NackReason::UNEXPECTED == Frame::ack(9).nack_reason());
}

TEST(FrameCodec, DecodeRecoversEncodedFrame)
{
	std::vector<uint8_t> chunk(512);
	for (unsigned int i = 0; i < chunk.size(); i++)
		chunk[i] = i * 7;

	std::vector<Frame> frames = feed_all(FrameCodec::encode(Frame::data(42, chunk)));

	CHECK_EQUAL(1, frames.size());
	CHECK_TRUE(FrameKind::DATA == frames[0].kind);
	CHECK_EQUAL(42, frames[0].sequence);
	CHECK_TRUE(chunk == frames[0].payload);
	CHECK_EQUAL(0, decoder->errors());
}

TEST(FrameCodec, EmptyPayloadFrame)
{
	std::vector<Frame> frames = feed_all(FrameCodec::encode(Frame::abort()));
	CHECK_EQUAL(1, frames.size());
	CHECK_TRUE(FrameKind::ABORT == frames[0].kind);
	CHECK_TRUE(frames[0].payload.empty());
}

TEST(FrameCodec, BackToBackFrames)
{
	std::vector<uint8_t> wire = FrameCodec::encode(Frame::ack(1));
	std::vector<uint8_t> second = FrameCodec::encode(Frame::done(2));
	wire.insert(wire.end(), second.begin(), second.end());

	std::vector<Frame> frames = feed_all(wire);
	CHECK_EQUAL(2, frames.size());
	CHECK_TRUE(FrameKind::ACK == frames[0].kind);
	CHECK_TRUE(FrameKind::DONE == frames[1].kind);
	CHECK_EQUAL(2, frames[1].sequence);
}

TEST(FrameCodec, LeadingGarbageIsSkipped)
{
	std::vector<uint8_t> wire = { 0x00, 0x13, 0x37 };
	std::vector<uint8_t> frame = FrameCodec::encode(Frame::ack(5));
	wire.insert(wire.end(), frame.begin(), frame.end());

	std::vector<Frame> frames = feed_all(wire);
	CHECK_EQUAL(1, frames.size());
	CHECK_EQUAL(5, frames[0].sequence);
}

TEST(FrameCodec, CorruptedFrameIsDropped)
{
	std::vector<uint8_t> chunk = { 1, 2, 3, 4 };
	std::vector<uint8_t> wire = FrameCodec::encode(Frame::data(3, chunk));
	wire[FrameCodec::HEADER_SIZE + 1] ^= 0x40;

	std::vector<Frame> frames = feed_all(wire);
	CHECK_EQUAL(0, frames.size());
	CHECK_EQUAL(1, decoder->errors());
}

TEST(FrameCodec, ResyncFindsFrameAfterCorruptedOne)
{
	std::vector<uint8_t> chunk = { 9, 9, 9, 9 };
	std::vector<uint8_t> wire = FrameCodec::encode(Frame::data(3, chunk));
	wire[FrameCodec::HEADER_SIZE] ^= 0x01;
	std::vector<uint8_t> good = FrameCodec::encode(Frame::data(4, chunk));
	wire.insert(wire.end(), good.begin(), good.end());

	std::vector<Frame> frames = feed_all(wire);
	CHECK_EQUAL(1, frames.size());
	CHECK_EQUAL(4, frames[0].sequence);
}

TEST(FrameCodec, TruncatedHeaderLengthDoesNotSwallowNextFrame)
{
	// A lone sync byte followed by a valid frame: the bogus header is rejected
	// and the real frame is recovered from the buffered bytes
	std::vector<uint8_t> wire = { FrameCodec::SYNC };
	std::vector<uint8_t> good = FrameCodec::encode(Frame::ack(7));
	wire.insert(wire.end(), good.begin(), good.end());

	std::vector<Frame> frames = feed_all(wire);
	CHECK_EQUAL(1, frames.size());
	CHECK_EQUAL(7, frames[0].sequence);
	CHECK_EQUAL(1, decoder->errors());
}

TEST(FrameCodec, OversizedPayloadIsRejected)
{
	std::vector<uint8_t> chunk(FRAME_MAX_PAYLOAD + 1);
	CHECK_THROWS(ErrorCode, FrameCodec::encode(Frame::data(1, chunk)));

	chunk.pop_back();
	CHECK_EQUAL(FrameCodec::HEADER_SIZE + FRAME_MAX_PAYLOAD + FrameCodec::TRAILER_SIZE,
				FrameCodec::encode(Frame::data(1, chunk)).size());
}

TEST(FrameCodec, OversizedLengthFieldIsRejected)
{
	std::vector<uint8_t> wire = FrameCodec::encode(Frame::ack(1));
	wire[6] = 0xFF;
	wire[7] = 0xFF;

	CHECK_EQUAL(0, feed_all(wire).size());
	CHECK_TRUE(decoder->errors() >= 1);
}
