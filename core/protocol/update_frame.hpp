#pragma once

#include <cstdint>
#include <vector>

static constexpr const unsigned int FRAME_MAX_PAYLOAD = 1024;

// HELLO flags
static constexpr const uint32_t HELLO_FLAG_LZ4 = 0x00000001;   // payload is one raw LZ4 block
static constexpr const uint32_t HELLO_FLAGS_SUPPORTED = HELLO_FLAG_LZ4;

enum class FrameKind : uint8_t {
	HELLO = 1,
	DATA  = 2,
	ACK   = 3,
	NACK  = 4,
	ABORT = 5,
	DONE  = 6
};

enum class NackReason : uint8_t {
	NOT_NEGOTIATED = 1,
	SIZE_INVALID,
	SESSION_MISMATCH,
	OUT_OF_WINDOW,
	LENGTH_EXCEEDED,
	HASH_MISMATCH,
	IMAGE_INVALID,
	FLASH_FAULT,
	BAD_FRAME,
	UNEXPECTED,
	DECOMPRESS_FAILED,
};

struct Frame {
	uint32_t sequence = 0;
	FrameKind kind = FrameKind::ACK;
	std::vector<uint8_t> payload;

	static Frame hello(uint32_t image_size, uint32_t token, uint32_t flags = 0);
	static Frame data(uint32_t sequence, const std::vector<uint8_t> &chunk);
	static Frame ack(uint32_t sequence);
	static Frame nack(uint32_t sequence, NackReason reason);
	static Frame abort();
	static Frame done(uint32_t sequence);

	// HELLO accessors; false when the payload is malformed
	bool hello_params(uint32_t &image_size, uint32_t &token) const;
	bool hello_params(uint32_t &image_size, uint32_t &token, uint32_t &flags) const;
	NackReason nack_reason() const;
};
