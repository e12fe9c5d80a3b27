#include "boot_selector.hpp"
#include "bootloader_config.hpp"
#include "flash_commit.hpp"
#include "image_validator.hpp"
#include "update_receiver.hpp"
#include "transport.hpp"
#include "blink_code.hpp"
#include "logger.hpp"
#include "pmu.hpp"
#include "led.hpp"
#include "debug.hpp"

// These contexts must be created before the FSM is started
extern BootloaderConfig *bootloader_config;
extern BootRecordStore *boot_record_store;
extern FlashCommitCoordinator *flash_commit;
extern ImageValidator *image_validator;
extern Transport *update_transport;
extern Led *status_led;
extern Logger *boot_log;


void BootSelector::react(tinyfsm::Event const &) { }

void BootSelector::react(ResetEvent const &) {
	DEBUG_TRACE("BootSelector::react: ResetEvent");
	transit<BootEvaluate>();
}

void BootSelector::react(ErrorEvent const &event) {
	DEBUG_ERROR("BootSelector::react: ErrorEvent: error_code=%u", event.error_code);
	set_halt_code(0, event.error_code);
	transit<BootHalt>();
}

void BootSelector::entry(void) { }
void BootSelector::exit(void) { }

void BootSelector::log_decision(BootDecision decision, uint8_t slot) {
	m_last_decision = decision;

	if (!boot_log)
		return;

	BootDecisionLogEntry entry;
	boot_log->stamp(entry.header, LOG_BOOT, sizeof(entry.decision) + sizeof(entry.slot) + sizeof(entry.status) +
					sizeof(entry.trial_count) + sizeof(entry.generation));
	entry.decision = decision;
	entry.slot = slot;
	entry.status = static_cast<uint8_t>(m_record.status);
	entry.trial_count = m_record.trial_count;
	entry.generation = m_record.generation;
	boot_log->write(&entry);
}

bool BootSelector::try_commit(BootRecord &record) {
	if (!m_record_writable) {
		DEBUG_WARN("BootSelector::try_commit: record writes disabled for this reset");
		return false;
	}

	try {
		flash_commit->commit_boot_record(record);
		return true;
	} catch (ErrorCode e) {
		DEBUG_ERROR("BootSelector::try_commit: commit failed: error_code=%u", e);
		m_record_writable = false;
		return false;
	}
}

void BootSelector::revert() {
	BootRecord reverted = m_record;
	reverted.pending_slot = NO_SLOT;
	reverted.status = BootStatus::CONFIRMED;
	reverted.trial_count = 0;

	if (try_commit(reverted))
		m_record = reverted;

	DEBUG_INFO("BootSelector::revert: reverting to slot %u", m_record.active_slot);
	log_decision(BootDecision::ROLLBACK, m_record.active_slot);
}

void BootSelector::set_halt_code(uint32_t major, uint32_t minor) {
	m_halt_code[0] = major;
	m_halt_code[1] = minor;
}

bool BootSelector::select_if_valid(uint8_t slot_id) {
	const SlotDescriptor *slot = bootloader_config->find_slot(slot_id);
	if (!slot) {
		DEBUG_WARN("BootSelector::select_if_valid: slot %u is not configured", slot_id);
		return false;
	}

	ValidationResult result = image_validator->validate(*slot);
	if (!ImageValidator::is_valid(result))
		return false;

	m_boot_slot = slot_id;
	m_entry_point = std::get<ValidImage>(result).entry_point;
	return true;
}

void BootStart::entry() {
	DEBUG_INFO("entry: BootStart");
}

void BootEvaluate::entry() {
	DEBUG_INFO("entry: BootEvaluate");

	m_boot_slot = NO_SLOT;
	m_entry_point = 0;
	m_record_writable = true;

	BootRecord record;
	RecordLoadStatus status = boot_record_store->load(record);

	if (status == RecordLoadStatus::CORRUPT) {
		DEBUG_ERROR("BootEvaluate: boot record corrupt");
		set_halt_code(HALT_RECORD_CORRUPT[0], HALT_RECORD_CORRUPT[1]);
		transit<BootHalt>();
		return;
	}

	if (status == RecordLoadStatus::BLANK) {
		record = BootRecord();
		record.active_slot = bootloader_config->layout.slots.front().id;
		m_record = record;
		if (try_commit(record))
			m_record = record;
		DEBUG_INFO("BootEvaluate: provisioned slot %u", m_record.active_slot);
		log_decision(BootDecision::PROVISIONED, m_record.active_slot);
	} else {
		m_record = record;
	}

	DEBUG_INFO("BootEvaluate: active=%u pending=%u status=%u trial_count=%u generation=%lu",
			   m_record.active_slot, m_record.pending_slot, (unsigned int)m_record.status,
			   m_record.trial_count, (unsigned long)m_record.generation);

	if (PMU::is_update_requested()) {
		if (update_transport) {
			log_decision(BootDecision::UPDATE_MODE, bootloader_config->staging_slot_for(m_record.active_slot).id);
			transit<BootUpdate>();
			return;
		}
		DEBUG_WARN("BootEvaluate: update requested but no transport is available");
	}

	if (!m_record.is_trial()) {
		transit<BootActive>();
		return;
	}

	if (m_record.status == BootStatus::ROLLBACK_REQUESTED ||
		m_record.trial_count >= bootloader_config->boot.max_trial_count) {
		DEBUG_WARN("BootEvaluate: trial of slot %u abandoned after %u attempts", m_record.pending_slot, m_record.trial_count);
		revert();
		transit<BootActive>();
		return;
	}

	BootRecord next = m_record;
	next.trial_count++;
	if (!try_commit(next)) {
		DEBUG_ERROR("BootEvaluate: could not count trial attempt, falling back to slot %u", m_record.active_slot);
		transit<BootActive>();
		return;
	}

	m_record = next;
	transit<BootPending>();
}

void BootActive::entry() {
	DEBUG_INFO("entry: BootActive");

	if (select_if_valid(m_record.active_slot)) {
		log_decision(BootDecision::BOOT_ACTIVE, m_boot_slot);
		transit<BootExecute>();
		return;
	}

	transit<BootRecover>();
}

void BootPending::entry() {
	DEBUG_INFO("entry: BootPending");

	if (select_if_valid(m_record.pending_slot)) {
		log_decision(BootDecision::BOOT_TRIAL, m_boot_slot);
		transit<BootExecute>();
		return;
	}

	// An image that fails validation never gets another attempt
	revert();
	transit<BootActive>();
}

void BootRecover::entry() {
	DEBUG_INFO("entry: BootRecover");

	for (uint8_t id : bootloader_config->boot.recover_priority) {
		if (id == m_record.active_slot)
			continue;

		if (!select_if_valid(id))
			continue;

		BootRecord recovered = m_record;
		recovered.active_slot = id;
		recovered.pending_slot = NO_SLOT;
		recovered.status = BootStatus::CONFIRMED;
		recovered.trial_count = 0;
		if (try_commit(recovered))
			m_record = recovered;

		DEBUG_WARN("BootRecover: recovered slot %u", id);
		log_decision(BootDecision::RECOVER, id);
		transit<BootExecute>();
		return;
	}

	DEBUG_ERROR("BootRecover: no bootable image");
	set_halt_code(HALT_NO_BOOTABLE_IMAGE[0], HALT_NO_BOOTABLE_IMAGE[1]);
	transit<BootHalt>();
}

void BootExecute::entry() {
	DEBUG_INFO("entry: BootExecute: slot %u entry_point=0x%08x", m_boot_slot, (unsigned int)m_entry_point);
	PMU::start_image(m_entry_point);
}

void BootUpdate::entry() {
	DEBUG_INFO("entry: BootUpdate");

	UpdateReceiver receiver(*bootloader_config, *update_transport, *flash_commit, *image_validator, boot_log);
	UpdateOutcome outcome = receiver.run(m_record);

	DEBUG_INFO("BootUpdate: session %s", outcome == UpdateOutcome::COMMITTED ? "committed" : "aborted");
	PMU::reset(false);
}

void BootHalt::entry() {
	DEBUG_ERROR("entry: BootHalt: code={%u,%u}", (unsigned int)m_halt_code[0], (unsigned int)m_halt_code[1]);
	log_decision(BootDecision::HALT, NO_SLOT);

	if (status_led) {
		BlinkCode blink(*status_led);
		blink.signal({ m_halt_code[0], m_halt_code[1] }, HALT_BLINK_REPEATS);
	}

	PMU::halt();
}
