#pragma once

#include <cstdio>
#include <cstring>
#include <cstdint>

#include "flash_interface.hpp"

// In-memory NOR flash used by the host port and the unit tests
class RamFlash : public FlashInterface {
protected:
	uint8_t *m_ram;

	bool in_range(uint32_t offset, uint32_t length) const {
		return offset <= size() && length <= (size() - offset);
	}

public:
	RamFlash(unsigned int sector_size, unsigned int sectors, unsigned int page_size) : FlashInterface(sector_size, sectors, page_size) {
		m_ram = new uint8_t[sector_size * sectors];
		std::memset(m_ram, 0xFF, sector_size * sectors);
		m_debug_trace = false;
	}
	~RamFlash() {
		delete[] m_ram;
	}

	int read(uint32_t offset, void *buffer, uint32_t size) override {
		if (m_debug_trace)
			printf("read(%u %u)\n", offset, size);
		if (!in_range(offset, size))
			return FLASH_ERR_INVAL;
		std::memcpy(buffer, &m_ram[offset], size);
		return FLASH_OK;
	}
	int prog(uint32_t offset, const void *buffer, uint32_t size) override {
		if (m_debug_trace)
			printf("prog(%u %u)\n", offset, size);
		if (!in_range(offset, size))
			return FLASH_ERR_INVAL;
		const uint8_t *src = static_cast<const uint8_t *>(buffer);
		for (uint32_t i = 0; i < size; i++)
			m_ram[offset + i] &= src[i];
		return FLASH_OK;
	}
	int erase(uint32_t sector) override {
		if (m_debug_trace)
			printf("erase(%u)\n", sector);
		if (sector >= m_sectors)
			return FLASH_ERR_INVAL;
		std::memset(&m_ram[sector * m_sector_size], 0xFF, m_sector_size);
		return FLASH_OK;
	}
	int sync() override { return FLASH_OK; }

	// Direct access for test harnesses (tampering, snapshots)
	uint8_t *data() { return m_ram; }

	bool m_debug_trace;
};
