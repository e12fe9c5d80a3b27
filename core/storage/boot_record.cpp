#include <algorithm>
#include <cstddef>
#include <cstring>

#include "boot_record.hpp"
#include "crc32.hpp"
#include "error.hpp"
#include "debug.hpp"


BootRecordEntry BootRecordEntry::encode(const BootRecord &record) {
	BootRecordEntry entry;
	entry.magic = MAGIC;
	entry.layout_version = LAYOUT_VERSION;
	entry.active_slot = record.active_slot;
	entry.pending_slot = record.pending_slot;
	entry.status = static_cast<uint8_t>(record.status);
	entry.trial_count = record.trial_count;
	entry.reserved = 0xFFFF;
	entry.generation = record.generation;
	entry.crc32 = CRC32::checksum(reinterpret_cast<const uint8_t *>(&entry), offsetof(BootRecordEntry, crc32));
	return entry;
}

bool BootRecordEntry::decode(BootRecord &record) const {
	if (magic != MAGIC || layout_version != LAYOUT_VERSION)
		return false;

	if (crc32 != CRC32::checksum(reinterpret_cast<const uint8_t *>(this), offsetof(BootRecordEntry, crc32)))
		return false;

	if (status < static_cast<uint8_t>(BootStatus::CONFIRMED) ||
		status > static_cast<uint8_t>(BootStatus::ROLLBACK_REQUESTED))
		return false;

	record.active_slot = active_slot;
	record.pending_slot = pending_slot;
	record.status = static_cast<BootStatus>(status);
	record.trial_count = trial_count;
	record.generation = generation;
	return true;
}

BootRecordStore::BootRecordStore(FlashInterface &flash, uint32_t region_offset, unsigned int region_sectors, unsigned int max_attempts) :
	m_flash(flash), m_region_offset(region_offset), m_region_sectors(region_sectors), m_max_attempts(max_attempts) {
	m_scanned = false;
	m_has_valid = false;
	m_has_garbage = false;
	m_abandoned_provisioning = false;
	m_newest_index = 0;
}

BootRecordStore::EntryState BootRecordStore::read_entry(unsigned int index, BootRecord &record) {
	uint8_t buffer[ENTRY_SIZE];

	if (m_flash.read(entry_offset(index), buffer, sizeof(buffer)) != FLASH_OK) {
		DEBUG_WARN("BootRecordStore::read_entry: read failed at entry %u", index);
		return EntryState::GARBAGE;
	}

	if (std::all_of(buffer, buffer + sizeof(buffer), [](uint8_t b) { return b == 0xFF; }))
		return EntryState::ERASED;

	BootRecordEntry entry;
	std::memcpy(&entry, buffer, sizeof(entry));
	return entry.decode(record) ? EntryState::VALID : EntryState::GARBAGE;
}

void BootRecordStore::scan() {
	unsigned int written = 0;
	bool leading = true;

	m_has_valid = false;
	m_has_garbage = false;

	for (unsigned int i = 0; i < total_entries(); i++) {
		BootRecord record;
		EntryState state = read_entry(i, record);

		if (state != EntryState::ERASED) {
			if (i != written)
				leading = false;
			written++;
		}

		switch (state) {
		case EntryState::VALID:
			if (!m_has_valid || record.generation > m_newest.generation) {
				m_newest = record;
				m_newest_index = i;
				m_has_valid = true;
			}
			break;
		case EntryState::GARBAGE:
			m_has_garbage = true;
			break;
		case EntryState::ERASED:
			break;
		}
	}

	// Torn first-boot appends only ever occupy the leading entries of the first sector
	m_abandoned_provisioning = !m_has_valid && m_has_garbage && leading && written < entries_per_sector();
	m_scanned = true;
}

RecordLoadStatus BootRecordStore::load(BootRecord &record) {
	scan();

	if (m_has_valid) {
		if (m_has_garbage)
			DEBUG_WARN("BootRecordStore::load: ignoring damaged entries");
		DEBUG_TRACE("BootRecordStore::load: generation=%lu at entry %u", (unsigned long)m_newest.generation, m_newest_index);
		record = m_newest;
		return RecordLoadStatus::VALID;
	}

	if (m_abandoned_provisioning) {
		DEBUG_WARN("BootRecordStore::load: discarding interrupted first record");
		return RecordLoadStatus::BLANK;
	}

	if (m_has_garbage) {
		DEBUG_ERROR("BootRecordStore::load: no valid boot record");
		return RecordLoadStatus::CORRUPT;
	}

	DEBUG_INFO("BootRecordStore::load: record region is blank");
	return RecordLoadStatus::BLANK;
}

uint32_t BootRecordStore::generation() {
	if (!m_scanned)
		scan();
	return m_has_valid ? m_newest.generation : 0;
}

bool BootRecordStore::find_free_entry(unsigned int sector_index, unsigned int from, unsigned int &index) {
	unsigned int first = sector_index * entries_per_sector();
	unsigned int last = first + entries_per_sector();

	for (unsigned int i = std::max(first, from); i < last; i++) {
		BootRecord unused;
		if (read_entry(i, unused) == EntryState::ERASED) {
			index = i;
			return true;
		}
	}

	return false;
}

void BootRecordStore::erase_sector(unsigned int sector_index) {
	uint32_t sector = m_flash.sector_of(m_region_offset) + sector_index;

	DEBUG_TRACE("BootRecordStore::erase_sector: sector %u", (unsigned int)sector);
	if (m_flash.erase(sector) != FLASH_OK)
		throw FLASH_ERASE_FAILED;

	for (unsigned int i = 0; i < entries_per_sector(); i++) {
		BootRecord unused;
		if (read_entry((sector_index * entries_per_sector()) + i, unused) != EntryState::ERASED) {
			DEBUG_ERROR("BootRecordStore::erase_sector: sector %u not blank after erase", (unsigned int)sector);
			throw FLASH_ERASE_FAILED;
		}
	}
}

unsigned int BootRecordStore::rotate(unsigned int current_sector) {
	unsigned int next = (current_sector + 1) % m_region_sectors;
	DEBUG_INFO("BootRecordStore::rotate: log sector %u full, moving to %u", current_sector, next);
	erase_sector(next);
	return next;
}

bool BootRecordStore::append(unsigned int index, const BootRecordEntry &entry) {
	uint8_t buffer[ENTRY_SIZE];
	uint8_t readback[ENTRY_SIZE];

	std::memset(buffer, 0xFF, sizeof(buffer));
	std::memcpy(buffer, &entry, sizeof(entry));

	if (m_flash.prog(entry_offset(index), buffer, sizeof(buffer)) != FLASH_OK || m_flash.sync() != FLASH_OK)
		return false;

	if (m_flash.read(entry_offset(index), readback, sizeof(readback)) != FLASH_OK)
		return false;

	return std::memcmp(buffer, readback, sizeof(buffer)) == 0;
}

void BootRecordStore::commit(BootRecord &record) {
	if (record.active_slot == NO_SLOT || record.active_slot == record.pending_slot ||
		(record.is_trial() && record.pending_slot == NO_SLOT)) {
		DEBUG_ERROR("BootRecordStore::commit: refusing inconsistent record");
		throw BOOT_RECORD_INVALID;
	}

	if (!m_scanned)
		scan();

	BootRecord next = record;
	next.generation = (m_has_valid ? m_newest.generation : 0) + 1;
	BootRecordEntry entry = BootRecordEntry::encode(next);

	unsigned int sector_index = m_has_valid ? (m_newest_index / entries_per_sector()) : 0;
	unsigned int from = m_has_valid ? (m_newest_index + 1) : 0;

	for (unsigned int attempt = 0; attempt < m_max_attempts; attempt++) {
		unsigned int index;
		if (!find_free_entry(sector_index, from, index)) {
			sector_index = rotate(sector_index);
			index = sector_index * entries_per_sector();
			from = index;
		}

		if (append(index, entry)) {
			DEBUG_TRACE("BootRecordStore::commit: generation=%lu at entry %u", (unsigned long)next.generation, index);
			m_newest = next;
			m_newest_index = index;
			m_has_valid = true;
			record = next;
			return;
		}

		// The failed entry is abandoned, never reprogrammed
		DEBUG_WARN("BootRecordStore::commit: verify failed at entry %u (attempt %u)", index, attempt + 1);
		m_has_garbage = true;
		from = index + 1;
	}

	DEBUG_ERROR("BootRecordStore::commit: giving up after %u attempts", m_max_attempts);
	throw FLASH_VERIFY_FAILED;
}
