#pragma once

#include <cstdint>
#include <vector>

#include "flash_interface.hpp"
#include "bootloader_config.hpp"
#include "boot_record.hpp"

// Owns every write the bootloader makes: staged image bytes go through a page
// buffer into the staging slot and the boot record is switched last.
class FlashCommitCoordinator {
public:
	FlashCommitCoordinator(FlashInterface &flash, BootRecordStore &record_store, unsigned int retries);

	// Erases the slot's footer sector first so a partly staged image can never validate
	void begin_staging(const SlotDescriptor &slot);

	// offset is relative to the start of the staging slot
	void stage_write(uint32_t offset, const uint8_t *data, uint32_t length);

	// Reads back staged bytes, including those still held in the page buffer
	void read_staged(uint32_t offset, uint8_t *data, uint32_t length);
	void flush();
	void abort_staging();

	// Flushes any staged data and then appends the record
	void commit_boot_record(BootRecord &record);

	bool is_staging() const { return m_staging; }
	const SlotDescriptor &staging_slot() const { return m_slot; }

private:
	static inline const uint32_t NO_PAGE = 0xFFFFFFFF;

	FlashInterface  &m_flash;
	BootRecordStore &m_record_store;
	unsigned int     m_retries;

	bool                 m_staging;
	SlotDescriptor       m_slot;
	std::vector<bool>    m_erased;
	std::vector<uint8_t> m_page;
	uint32_t             m_page_base;
	uint32_t             m_dirty_start;
	uint32_t             m_dirty_end;

	void ensure_erased(uint32_t slot_offset);
	void erase_sector(unsigned int slot_sector);
	void program_page();
};
