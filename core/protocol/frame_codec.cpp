#include <algorithm>

#include "frame_codec.hpp"
#include "crc32.hpp"
#include "error.hpp"
#include "debug.hpp"


std::vector<uint8_t> FrameCodec::encode(const Frame &frame) {
	if (frame.payload.size() > FRAME_MAX_PAYLOAD) {
		DEBUG_ERROR("FrameCodec::encode: payload of %u bytes too large", (unsigned int)frame.payload.size());
		throw FRAME_TOO_LARGE;
	}

	std::vector<uint8_t> out;
	uint16_t length = (uint16_t)frame.payload.size();

	out.reserve(HEADER_SIZE + length + TRAILER_SIZE);
	out.push_back(SYNC);
	out.push_back(static_cast<uint8_t>(frame.kind));
	for (unsigned int i = 0; i < 4; i++)
		out.push_back((frame.sequence >> (8 * i)) & 0xFF);
	out.push_back(length & 0xFF);
	out.push_back(length >> 8);
	out.insert(out.end(), frame.payload.begin(), frame.payload.end());

	uint32_t crc = CRC32::checksum(&out[1], out.size() - 1);
	for (unsigned int i = 0; i < 4; i++)
		out.push_back((crc >> (8 * i)) & 0xFF);

	return out;
}

void FrameDecoder::reset() {
	m_state = DecodeState::SYNC;
	m_buffer.clear();
	m_expected = 0;
	m_errors = 0;
}

bool FrameDecoder::resync(Frame &frame) {
	m_errors++;

	// Look for another sync byte inside what was already consumed
	auto it = std::find(m_buffer.begin() + 1, m_buffer.end(), FrameCodec::SYNC);
	std::vector<uint8_t> pending(it, m_buffer.end());

	m_buffer.clear();
	m_state = DecodeState::SYNC;

	bool recovered = false;
	for (uint8_t b : pending)
		recovered = feed(b, frame) || recovered;

	return recovered;
}

bool FrameDecoder::feed(uint8_t byte, Frame &frame) {
	switch (m_state) {
	case DecodeState::SYNC:
		if (byte == FrameCodec::SYNC) {
			m_buffer.clear();
			m_buffer.push_back(byte);
			m_state = DecodeState::HEADER;
		}
		return false;

	case DecodeState::HEADER:
		m_buffer.push_back(byte);
		if (m_buffer.size() == FrameCodec::HEADER_SIZE) {
			unsigned int length = m_buffer[6] | (m_buffer[7] << 8);
			uint8_t kind = m_buffer[1];
			if (length > FRAME_MAX_PAYLOAD ||
				kind < static_cast<uint8_t>(FrameKind::HELLO) || kind > static_cast<uint8_t>(FrameKind::DONE)) {
				DEBUG_WARN("FrameDecoder::feed: bad header kind=%u len=%u", kind, length);
				return resync(frame);
			}
			m_expected = FrameCodec::HEADER_SIZE + length + FrameCodec::TRAILER_SIZE;
			m_state = DecodeState::BODY;
		}
		return false;

	case DecodeState::BODY:
		m_buffer.push_back(byte);
		if (m_buffer.size() < m_expected)
			return false;

		{
			unsigned int body = m_expected - FrameCodec::TRAILER_SIZE;
			uint32_t crc = (uint32_t)m_buffer[body] | ((uint32_t)m_buffer[body + 1] << 8) |
						   ((uint32_t)m_buffer[body + 2] << 16) | ((uint32_t)m_buffer[body + 3] << 24);
			if (crc != CRC32::checksum(&m_buffer[1], body - 1)) {
				DEBUG_WARN("FrameDecoder::feed: CRC mismatch");
				return resync(frame);
			}

			frame.kind = static_cast<FrameKind>(m_buffer[1]);
			frame.sequence = (uint32_t)m_buffer[2] | ((uint32_t)m_buffer[3] << 8) |
							 ((uint32_t)m_buffer[4] << 16) | ((uint32_t)m_buffer[5] << 24);
			frame.payload.assign(m_buffer.begin() + FrameCodec::HEADER_SIZE, m_buffer.begin() + body);
		}

		m_buffer.clear();
		m_state = DecodeState::SYNC;
		return true;
	}

	return false;
}
