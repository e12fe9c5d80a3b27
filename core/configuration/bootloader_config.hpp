#pragma once

#include <cstdint>
#include <vector>

static constexpr const uint8_t NO_SLOT = 0xFF;

struct SlotDescriptor {
	uint8_t  id;
	uint32_t offset;
	uint32_t size;
};

struct FlashLayout {
	unsigned int sector_size;
	unsigned int page_size;
	unsigned int sectors;
	std::vector<SlotDescriptor> slots;
	uint32_t     record_offset;
	unsigned int record_sectors;
};

enum class ConfirmPolicy {
	EXPLICIT,          // Application must call BootControl::confirm()
	IMPLICIT_TIMEOUT   // Confirmed once the image has run for implicit_confirm_ms
};

struct BootPolicy {
	unsigned int max_trial_count;
	ConfirmPolicy confirm_policy;
	unsigned int implicit_confirm_ms;
	std::vector<uint8_t> recover_priority;
};

struct UpdatePolicy {
	unsigned int recv_timeout_ms;
	unsigned int idle_timeout_ms;
	unsigned int reorder_window;
	unsigned int max_chunk_size;
	unsigned int flash_retries;
};

class BootloaderConfig {
public:
	static inline const unsigned int DEFAULT_MAX_TRIAL_COUNT = 3;
	static inline const unsigned int DEFAULT_IMPLICIT_CONFIRM_MS = 30000;
	static inline const unsigned int DEFAULT_RECV_TIMEOUT_MS = 1000;
	static inline const unsigned int DEFAULT_IDLE_TIMEOUT_MS = 30000;
	static inline const unsigned int DEFAULT_REORDER_WINDOW = 4;
	static inline const unsigned int DEFAULT_MAX_CHUNK_SIZE = 1024;
	static inline const unsigned int DEFAULT_FLASH_RETRIES = 3;

	FlashLayout  layout;
	BootPolicy   boot;
	UpdatePolicy update;

	BootloaderConfig(const FlashLayout &flash_layout);

	// Throws BAD_CONFIGURATION
	void validate() const;

	const SlotDescriptor *find_slot(uint8_t id) const;
	const SlotDescriptor &staging_slot_for(uint8_t active_id) const;
	uint32_t record_region_size() const { return layout.record_sectors * layout.sector_size; }
};
