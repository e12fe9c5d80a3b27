#include <algorithm>
#include <cstring>

#include "flash_commit.hpp"
#include "image_footer.hpp"
#include "error.hpp"
#include "debug.hpp"


FlashCommitCoordinator::FlashCommitCoordinator(FlashInterface &flash, BootRecordStore &record_store, unsigned int retries) :
	m_flash(flash), m_record_store(record_store), m_retries(retries)
{
	m_staging = false;
	m_slot = { NO_SLOT, 0, 0 };
	m_page.resize(m_flash.m_page_size);
	m_page_base = NO_PAGE;
	m_dirty_start = 0;
	m_dirty_end = 0;
}

void FlashCommitCoordinator::begin_staging(const SlotDescriptor &slot) {
	DEBUG_INFO("FlashCommitCoordinator::begin_staging: slot %u offset=0x%08x size=%u", slot.id,
			   (unsigned int)slot.offset, (unsigned int)slot.size);

	m_slot = slot;
	m_erased.assign(slot.size / m_flash.m_sector_size, false);
	m_page_base = NO_PAGE;
	m_staging = true;

	ensure_erased(footer_offset(0, slot.size));
}

void FlashCommitCoordinator::erase_sector(unsigned int slot_sector) {
	uint32_t sector = m_flash.sector_of(m_slot.offset) + slot_sector;
	uint8_t buffer[256];

	DEBUG_TRACE("FlashCommitCoordinator::erase_sector: sector %u", (unsigned int)sector);

	if (m_flash.erase(sector) != FLASH_OK) {
		DEBUG_ERROR("FlashCommitCoordinator::erase_sector: erase failed on sector %u", (unsigned int)sector);
		throw FLASH_ERASE_FAILED;
	}

	for (uint32_t offset = 0; offset < m_flash.m_sector_size; offset += sizeof(buffer)) {
		uint32_t n = std::min<uint32_t>(sizeof(buffer), m_flash.m_sector_size - offset);
		if (m_flash.read((sector * m_flash.m_sector_size) + offset, buffer, n) != FLASH_OK)
			throw FLASH_READ_FAILED;
		if (!std::all_of(buffer, buffer + n, [](uint8_t b) { return b == 0xFF; })) {
			DEBUG_ERROR("FlashCommitCoordinator::erase_sector: sector %u not blank after erase", (unsigned int)sector);
			throw FLASH_ERASE_FAILED;
		}
	}

	m_erased[slot_sector] = true;
}

void FlashCommitCoordinator::ensure_erased(uint32_t slot_offset) {
	unsigned int slot_sector = slot_offset / m_flash.m_sector_size;
	if (!m_erased[slot_sector])
		erase_sector(slot_sector);
}

void FlashCommitCoordinator::program_page() {
	if (m_page_base == NO_PAGE || m_dirty_end <= m_dirty_start)
		return;

	ensure_erased(m_page_base);

	uint32_t address = m_slot.offset + m_page_base + m_dirty_start;
	uint32_t length = m_dirty_end - m_dirty_start;
	const uint8_t *src = &m_page[m_dirty_start];
	std::vector<uint8_t> readback(length);

	for (unsigned int attempt = 0; attempt < m_retries; attempt++) {
		if (m_flash.prog(address, src, length) == FLASH_OK &&
			m_flash.sync() == FLASH_OK &&
			m_flash.read(address, readback.data(), length) == FLASH_OK &&
			std::memcmp(src, readback.data(), length) == 0) {
			m_dirty_start = m_dirty_end = 0;
			return;
		}
		DEBUG_WARN("FlashCommitCoordinator::program_page: verify failed at 0x%08x (attempt %u)", (unsigned int)address, attempt + 1);
	}

	DEBUG_ERROR("FlashCommitCoordinator::program_page: giving up at 0x%08x", (unsigned int)address);
	throw FLASH_VERIFY_FAILED;
}

void FlashCommitCoordinator::stage_write(uint32_t offset, const uint8_t *data, uint32_t length) {
	if (!m_staging)
		throw STAGING_NOT_STARTED;

	if (offset > m_slot.size || length > (m_slot.size - offset)) {
		DEBUG_ERROR("FlashCommitCoordinator::stage_write: %u bytes at %u outside slot %u", (unsigned int)length,
					(unsigned int)offset, m_slot.id);
		throw STAGING_OUT_OF_RANGE;
	}

	while (length) {
		uint32_t page_base = offset - (offset % m_flash.m_page_size);
		if (page_base != m_page_base) {
			program_page();
			m_page_base = page_base;
			std::memset(m_page.data(), 0xFF, m_page.size());
			m_dirty_start = m_dirty_end = 0;
		}

		uint32_t page_offset = offset - page_base;
		uint32_t n = std::min<uint32_t>(length, m_flash.m_page_size - page_offset);
		std::memcpy(&m_page[page_offset], data, n);

		if (m_dirty_end <= m_dirty_start) {
			m_dirty_start = page_offset;
			m_dirty_end = page_offset + n;
		} else {
			m_dirty_start = std::min(m_dirty_start, page_offset);
			m_dirty_end = std::max(m_dirty_end, page_offset + n);
		}

		offset += n;
		data += n;
		length -= n;
	}
}

void FlashCommitCoordinator::read_staged(uint32_t offset, uint8_t *data, uint32_t length) {
	if (!m_staging)
		throw STAGING_NOT_STARTED;

	if (offset > m_slot.size || length > (m_slot.size - offset))
		throw STAGING_OUT_OF_RANGE;

	if (m_flash.read(m_slot.offset + offset, data, length) != FLASH_OK) {
		DEBUG_ERROR("FlashCommitCoordinator::read_staged: read failed at %u", (unsigned int)offset);
		throw FLASH_READ_FAILED;
	}

	if (m_page_base == NO_PAGE || m_dirty_end <= m_dirty_start)
		return;

	// Overlay the unprogrammed part of the current page
	uint32_t dirty_start = m_page_base + m_dirty_start;
	uint32_t dirty_end = m_page_base + m_dirty_end;
	uint32_t start = std::max(offset, dirty_start);
	uint32_t end = std::min(offset + length, dirty_end);
	if (start < end)
		std::memcpy(&data[start - offset], &m_page[start - m_page_base], end - start);
}

void FlashCommitCoordinator::flush() {
	if (!m_staging)
		return;
	program_page();
}

void FlashCommitCoordinator::abort_staging() {
	if (m_staging)
		DEBUG_WARN("FlashCommitCoordinator::abort_staging: discarding staged data for slot %u", m_slot.id);
	m_staging = false;
	m_page_base = NO_PAGE;
	m_dirty_start = m_dirty_end = 0;
}

void FlashCommitCoordinator::commit_boot_record(BootRecord &record) {
	flush();
	m_staging = false;
	m_page_base = NO_PAGE;

	m_record_store.commit(record);
	DEBUG_INFO("FlashCommitCoordinator::commit_boot_record: generation=%lu active=%u pending=%u",
			   (unsigned long)record.generation, record.active_slot, record.pending_slot);
}
