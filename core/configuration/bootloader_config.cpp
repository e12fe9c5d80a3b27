#include "bootloader_config.hpp"
#include "image_footer.hpp"
#include "update_frame.hpp"
#include "error.hpp"
#include "debug.hpp"

BootloaderConfig::BootloaderConfig(const FlashLayout &flash_layout) : layout(flash_layout) {
	boot.max_trial_count = DEFAULT_MAX_TRIAL_COUNT;
	boot.confirm_policy = ConfirmPolicy::EXPLICIT;
	boot.implicit_confirm_ms = DEFAULT_IMPLICIT_CONFIRM_MS;
	for (auto const &slot : layout.slots)
		boot.recover_priority.push_back(slot.id);

	update.recv_timeout_ms = DEFAULT_RECV_TIMEOUT_MS;
	update.idle_timeout_ms = DEFAULT_IDLE_TIMEOUT_MS;
	update.reorder_window = DEFAULT_REORDER_WINDOW;
	update.max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
	update.flash_retries = DEFAULT_FLASH_RETRIES;
}

static bool overlaps(uint32_t a_off, uint32_t a_size, uint32_t b_off, uint32_t b_size) {
	return a_off < (b_off + b_size) && b_off < (a_off + a_size);
}

void BootloaderConfig::validate() const {
	const uint32_t device_size = layout.sector_size * layout.sectors;

	if (layout.sector_size == 0 || layout.page_size == 0 || layout.sectors == 0 ||
		(layout.sector_size % layout.page_size) != 0) {
		DEBUG_ERROR("BootloaderConfig::validate: bad flash geometry");
		throw BAD_CONFIGURATION;
	}

	if (layout.slots.size() < 2) {
		DEBUG_ERROR("BootloaderConfig::validate: at least two slots are required");
		throw BAD_CONFIGURATION;
	}

	if (layout.record_sectors < 2 || (layout.record_offset % layout.sector_size) != 0 ||
		layout.record_offset + record_region_size() > device_size) {
		DEBUG_ERROR("BootloaderConfig::validate: bad boot record region");
		throw BAD_CONFIGURATION;
	}

	for (unsigned int i = 0; i < layout.slots.size(); i++) {
		const SlotDescriptor &slot = layout.slots[i];
		if (slot.id == NO_SLOT ||
			(slot.offset % layout.sector_size) != 0 ||
			(slot.size % layout.sector_size) != 0 ||
			slot.size <= IMAGE_FOOTER_SIZE ||
			slot.offset + slot.size > device_size) {
			DEBUG_ERROR("BootloaderConfig::validate: slot %u is misaligned or out of range", slot.id);
			throw BAD_CONFIGURATION;
		}
		if (overlaps(slot.offset, slot.size, layout.record_offset, record_region_size())) {
			DEBUG_ERROR("BootloaderConfig::validate: slot %u overlaps the boot record", slot.id);
			throw BAD_CONFIGURATION;
		}
		for (unsigned int j = i + 1; j < layout.slots.size(); j++) {
			const SlotDescriptor &other = layout.slots[j];
			if (slot.id == other.id || overlaps(slot.offset, slot.size, other.offset, other.size)) {
				DEBUG_ERROR("BootloaderConfig::validate: slots %u and %u collide", slot.id, other.id);
				throw BAD_CONFIGURATION;
			}
		}
	}

	for (auto id : boot.recover_priority) {
		if (!find_slot(id)) {
			DEBUG_ERROR("BootloaderConfig::validate: unknown slot %u in recover order", id);
			throw BAD_CONFIGURATION;
		}
	}

	// The persisted trial counter is a single byte
	if (boot.max_trial_count == 0 || boot.max_trial_count > UINT8_MAX ||
		update.reorder_window == 0 ||
		update.max_chunk_size == 0 || update.max_chunk_size > FRAME_MAX_PAYLOAD ||
		update.flash_retries == 0) {
		DEBUG_ERROR("BootloaderConfig::validate: bad policy values");
		throw BAD_CONFIGURATION;
	}
}

const SlotDescriptor *BootloaderConfig::find_slot(uint8_t id) const {
	for (auto const &slot : layout.slots)
		if (slot.id == id)
			return &slot;
	return nullptr;
}

const SlotDescriptor &BootloaderConfig::staging_slot_for(uint8_t active_id) const {
	for (auto const &slot : layout.slots)
		if (slot.id != active_id)
			return slot;
	throw BAD_CONFIGURATION;
}
