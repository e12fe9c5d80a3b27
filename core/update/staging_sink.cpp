#include <algorithm>

#include "staging_sink.hpp"
#include "crc32.hpp"
#include "error.hpp"


void StagingSink::literal(const uint8_t *data, uint32_t length) {
	m_flash_commit.stage_write(m_size, data, length);
	CRC32::update(data, length, m_crc);
	m_size += length;
}

void StagingSink::backref(uint32_t offset, uint32_t length) {
	uint8_t buffer[COPY_CHUNK];

	if (offset == 0 || offset > m_size)
		throw IMAGE_DECOMPRESS_FAILED;

	// Runs never exceed the distance back, so an overlapping copy repeats the pattern
	uint32_t source = m_size - offset;
	while (length) {
		uint32_t n = std::min(std::min(length, offset), COPY_CHUNK);
		m_flash_commit.read_staged(source, buffer, n);
		literal(buffer, n);
		source += n;
		length -= n;
	}
}
