#pragma once

#include <cstdint>

#include "flash_interface.hpp"
#include "bootloader_config.hpp"

enum class BootStatus : uint8_t {
	CONFIRMED = 1,
	TRIAL = 2,
	ROLLBACK_REQUESTED = 3
};

struct BootRecord {
	uint8_t    active_slot = 0;
	uint8_t    pending_slot = NO_SLOT;
	uint8_t    trial_count = 0;
	BootStatus status = BootStatus::CONFIRMED;
	uint32_t   generation = 0;

	bool is_trial() const {
		return status == BootStatus::TRIAL || status == BootStatus::ROLLBACK_REQUESTED;
	}

	bool operator==(const BootRecord &other) const {
		return active_slot == other.active_slot &&
			   pending_slot == other.pending_slot &&
			   trial_count == other.trial_count &&
			   status == other.status &&
			   generation == other.generation;
	}
	bool operator!=(const BootRecord &other) const { return !(*this == other); }
};

// On-flash encoding of one boot record generation
struct __attribute__((packed)) BootRecordEntry {
	static constexpr const uint32_t MAGIC = 0x43455242;   // "BREC"
	static constexpr const uint16_t LAYOUT_VERSION = 1;

	uint32_t magic;
	uint16_t layout_version;
	uint8_t  active_slot;
	uint8_t  pending_slot;
	uint8_t  status;
	uint8_t  trial_count;
	uint16_t reserved;
	uint32_t generation;
	uint32_t crc32;

	static BootRecordEntry encode(const BootRecord &record);
	bool decode(BootRecord &record) const;
};

static_assert(sizeof(BootRecordEntry) == 20, "BootRecordEntry layout is fixed");

enum class RecordLoadStatus {
	VALID,
	BLANK,     // Never provisioned: every entry is erased, or only an interrupted first append
	CORRUPT    // Something was written but no entry verifies
};

// Append/rotate log of BootRecordEntry over a dedicated run of sectors.
// The newest valid generation wins; a torn append can only ever cost the entry being written.
class BootRecordStore {
public:
	static inline const uint32_t ENTRY_SIZE = 32;

	BootRecordStore(FlashInterface &flash, uint32_t region_offset, unsigned int region_sectors, unsigned int max_attempts);

	RecordLoadStatus load(BootRecord &record);

	// Appends record as the next generation and verifies it by read-back.
	// On return record.generation holds the committed generation.
	void commit(BootRecord &record);

	uint32_t generation();
	unsigned int entries_per_sector() const { return m_flash.m_sector_size / ENTRY_SIZE; }
	uint32_t entry_offset(unsigned int index) const { return m_region_offset + (index * ENTRY_SIZE); }
	unsigned int total_entries() const { return entries_per_sector() * m_region_sectors; }

private:
	enum class EntryState { ERASED, VALID, GARBAGE };

	FlashInterface &m_flash;
	uint32_t     m_region_offset;
	unsigned int m_region_sectors;
	unsigned int m_max_attempts;

	bool         m_scanned;
	bool         m_has_valid;
	bool         m_has_garbage;
	bool         m_abandoned_provisioning;
	BootRecord   m_newest;
	unsigned int m_newest_index;

	EntryState read_entry(unsigned int index, BootRecord &record);
	void scan();
	bool find_free_entry(unsigned int sector_index, unsigned int from, unsigned int &index);
	unsigned int rotate(unsigned int current_sector);
	void erase_sector(unsigned int sector_index);
	bool append(unsigned int index, const BootRecordEntry &entry);
};
