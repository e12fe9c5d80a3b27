#pragma once

#include <cstdint>

#include "bootloader_config.hpp"

// Host board: 1 MiB NOR part with 4 KiB sectors
namespace BSP
{
	static constexpr const unsigned int FLASH_SECTOR_SIZE = 4096;
	static constexpr const unsigned int FLASH_PAGE_SIZE = 256;
	static constexpr const unsigned int FLASH_SECTORS = 256;

	static constexpr const uint32_t SLOT_0_OFFSET = 0x00000;
	static constexpr const uint32_t SLOT_1_OFFSET = 0x40000;
	static constexpr const uint32_t SLOT_SIZE = 0x40000;

	static constexpr const uint32_t BOOT_RECORD_OFFSET = 0x80000;
	static constexpr const unsigned int BOOT_RECORD_SECTORS = 2;

	static constexpr const int STATUS_LED_PIN = 0;

	static inline FlashLayout flash_layout() {
		FlashLayout layout;
		layout.sector_size = FLASH_SECTOR_SIZE;
		layout.page_size = FLASH_PAGE_SIZE;
		layout.sectors = FLASH_SECTORS;
		layout.slots = {
			{ 0, SLOT_0_OFFSET, SLOT_SIZE },
			{ 1, SLOT_1_OFFSET, SLOT_SIZE },
		};
		layout.record_offset = BOOT_RECORD_OFFSET;
		layout.record_sectors = BOOT_RECORD_SECTORS;
		return layout;
	}
}
