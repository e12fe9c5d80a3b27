#pragma once

#include <cstdint>

#include "lz4_decoder.hpp"
#include "flash_commit.hpp"

// Writes decompressed image bytes to the start of the staging slot and keeps
// the running content CRC. Back-references are copied from what has already
// been staged, so no history window is held in RAM.
class StagingSink : public Lz4Sink {
public:
	StagingSink(FlashCommitCoordinator &flash_commit) : m_flash_commit(flash_commit) { reset(); }

	void reset() {
		m_size = 0;
		m_crc = 0xFFFFFFFF;
	}

	void literal(const uint8_t *data, uint32_t length) override;
	void backref(uint32_t offset, uint32_t length) override;

	uint32_t size() const { return m_size; }
	uint32_t content_crc() const { return m_crc ^ 0xFFFFFFFF; }

private:
	static inline const uint32_t COPY_CHUNK = 64;

	FlashCommitCoordinator &m_flash_commit;
	uint32_t m_size;
	uint32_t m_crc;
};
