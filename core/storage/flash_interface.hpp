#pragma once

#include <cstdint>

enum FlashResult : int {
	FLASH_OK = 0,
	FLASH_ERR_IO = -5,
	FLASH_ERR_INVAL = -22,
	FLASH_ERR_TIMEOUT = -110,
};

// Raw NOR flash device: erased value is 0xFF and programming may only clear bits.
// Offsets are absolute byte addresses from the start of the device.
class FlashInterface {
public:
	unsigned int m_sectors;
	unsigned int m_sector_size;
	unsigned int m_page_size;

	FlashInterface(unsigned int sector_size, unsigned int sectors, unsigned int page_size) {
		m_sectors = sectors;
		m_sector_size = sector_size;
		m_page_size = page_size;
	}
	virtual ~FlashInterface() {}

	uint32_t size() const { return m_sectors * m_sector_size; }
	uint32_t sector_of(uint32_t offset) const { return offset / m_sector_size; }

	virtual int read(uint32_t offset, void *buffer, uint32_t size) = 0;
	virtual int prog(uint32_t offset, const void *buffer, uint32_t size) = 0;
	virtual int erase(uint32_t sector) = 0;
	virtual int sync() = 0;
};
