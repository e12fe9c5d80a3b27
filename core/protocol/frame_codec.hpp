#pragma once

#include <cstdint>
#include <vector>

#include "update_frame.hpp"

// Wire format: SYNC | kind | seq (u32 LE) | len (u16 LE) | payload | crc32 (u32 LE)
// The CRC covers everything from kind to the end of the payload.
class FrameCodec {
public:
	static inline const uint8_t SYNC = 0xA5;
	static inline const unsigned int HEADER_SIZE = 8;
	static inline const unsigned int TRAILER_SIZE = 4;

	// Throws FRAME_TOO_LARGE
	static std::vector<uint8_t> encode(const Frame &frame);
};

// Incremental decoder fed with raw bytes from a stream transport
class FrameDecoder {
public:
	FrameDecoder() { reset(); }

	void reset();

	// Returns true when byte completes a frame that passed length and CRC checks
	bool feed(uint8_t byte, Frame &frame);

	unsigned int errors() const { return m_errors; }

private:
	enum class DecodeState { SYNC, HEADER, BODY };

	DecodeState          m_state;
	std::vector<uint8_t> m_buffer;
	unsigned int         m_expected;
	unsigned int         m_errors;

	bool resync(Frame &frame);
};
