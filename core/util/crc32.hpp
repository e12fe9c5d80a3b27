#pragma once

#include <cstddef>
#include <cstdint>

// CRC-32/ISO-HDLC (reflected, poly 0x04C11DB7, init/xorout 0xFFFFFFFF)
class CRC32 {
private:
	static constexpr uint32_t POLY_REFLECTED = 0xEDB88320;

public:
	// Streaming form: caller seeds crc with 0xFFFFFFFF and finalises with ~crc
	static void update(const uint8_t *data, size_t length, uint32_t &crc) {
		for (size_t i = 0; i < length; i++) {
			crc ^= data[i];
			for (unsigned int bit = 0; bit < 8; bit++)
				crc = (crc >> 1) ^ (POLY_REFLECTED & (0U - (crc & 1U)));
		}
	}

	// One-shot form; data may be split across calls by passing the previous result back in
	static void checksum(const uint8_t *data, size_t length, uint32_t &crc) {
		crc ^= 0xFFFFFFFF;
		update(data, length, crc);
		crc ^= 0xFFFFFFFF;
	}

	static uint32_t checksum(const uint8_t *data, size_t length) {
		uint32_t crc = 0;
		checksum(data, length, crc);
		return crc;
	}
};
