#include <algorithm>

#include "lz4_decoder.hpp"
#include "error.hpp"
#include "debug.hpp"


void Lz4Decoder::reset(uint32_t output_limit, uint32_t dictionary_size) {
	m_stage = Stage::TOKEN;
	m_output_limit = output_limit;
	m_dictionary_size = dictionary_size;
	m_output = 0;
	m_literal_length = 0;
	m_match_length = 0;
	m_offset = 0;
}

void Lz4Decoder::extend(uint32_t &length, uint8_t byte) {
	length += byte;
	if (length > m_output_limit) {
		DEBUG_ERROR("Lz4Decoder::extend: run of %lu bytes exceeds limit", (unsigned long)length);
		throw IMAGE_DECOMPRESS_FAILED;
	}
}

void Lz4Decoder::begin_literals() {
	if (m_literal_length > m_output_limit - m_output) {
		DEBUG_ERROR("Lz4Decoder::begin_literals: %lu literals at %lu overrun output", (unsigned long)m_literal_length,
					(unsigned long)m_output);
		throw IMAGE_DECOMPRESS_FAILED;
	}
	m_stage = m_literal_length ? Stage::LITERALS : Stage::OFFSET_LOW;
}

void Lz4Decoder::emit_match() {
	uint32_t length = m_match_length + MIN_MATCH;

	if (length > m_output_limit - m_output) {
		DEBUG_ERROR("Lz4Decoder::emit_match: %lu byte match at %lu overruns output", (unsigned long)length,
					(unsigned long)m_output);
		throw IMAGE_DECOMPRESS_FAILED;
	}

	m_sink.backref(m_offset, length);
	m_output += length;
	m_stage = Stage::TOKEN;
}

void Lz4Decoder::feed(const uint8_t *data, uint32_t length) {
	while (length) {
		switch (m_stage) {
		case Stage::TOKEN:
			m_literal_length = *data >> 4;
			m_match_length = *data & 0x0F;
			data++;
			length--;
			if (m_literal_length == 15)
				m_stage = Stage::LITERAL_LENGTH;
			else
				begin_literals();
			break;

		case Stage::LITERAL_LENGTH:
		{
			uint8_t byte = *data++;
			length--;
			extend(m_literal_length, byte);
			if (byte != 255)
				begin_literals();
			break;
		}

		case Stage::LITERALS:
		{
			uint32_t n = std::min(length, m_literal_length);
			m_sink.literal(data, n);
			m_output += n;
			m_literal_length -= n;
			data += n;
			length -= n;
			if (m_literal_length == 0)
				m_stage = Stage::OFFSET_LOW;
			break;
		}

		case Stage::OFFSET_LOW:
			m_offset = *data++;
			length--;
			m_stage = Stage::OFFSET_HIGH;
			break;

		case Stage::OFFSET_HIGH:
			m_offset |= (uint32_t)*data++ << 8;
			length--;
			if (m_offset == 0 || m_offset > m_output + m_dictionary_size) {
				DEBUG_ERROR("Lz4Decoder::feed: offset %lu reaches before output start", (unsigned long)m_offset);
				throw IMAGE_DECOMPRESS_FAILED;
			}
			if (m_match_length == 15)
				m_stage = Stage::MATCH_LENGTH;
			else
				emit_match();
			break;

		case Stage::MATCH_LENGTH:
		{
			uint8_t byte = *data++;
			length--;
			extend(m_match_length, byte);
			if (byte != 255)
				emit_match();
			break;
		}
		}
	}
}

void Lz4Decoder::finish() {
	if (m_stage != Stage::OFFSET_LOW) {
		DEBUG_ERROR("Lz4Decoder::finish: block truncated");
		throw IMAGE_DECOMPRESS_FAILED;
	}
}
