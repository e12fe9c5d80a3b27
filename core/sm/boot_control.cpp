#include "boot_control.hpp"
#include "error.hpp"
#include "debug.hpp"


BootControl::BootControl(const BootloaderConfig &config, BootRecordStore &store, FlashCommitCoordinator &flash_commit) :
	m_config(config), m_store(store), m_flash_commit(flash_commit) {}

void BootControl::load() {
	if (m_store.load(m_record) != RecordLoadStatus::VALID) {
		DEBUG_ERROR("BootControl::load: no valid boot record");
		throw BOOT_RECORD_CORRUPT;
	}
}

bool BootControl::confirm() {
	if (m_record.status != BootStatus::TRIAL) {
		DEBUG_WARN("BootControl::confirm: nothing to confirm");
		return false;
	}

	BootRecord next = m_record;
	next.active_slot = m_record.pending_slot;
	next.pending_slot = NO_SLOT;
	next.status = BootStatus::CONFIRMED;
	next.trial_count = 0;
	m_flash_commit.commit_boot_record(next);
	m_record = next;

	DEBUG_INFO("BootControl::confirm: slot %u confirmed, generation=%lu", m_record.active_slot,
			   (unsigned long)m_record.generation);
	return true;
}

bool BootControl::request_rollback() {
	if (m_record.status != BootStatus::TRIAL) {
		DEBUG_WARN("BootControl::request_rollback: not running a trial image");
		return false;
	}

	BootRecord next = m_record;
	next.status = BootStatus::ROLLBACK_REQUESTED;
	m_flash_commit.commit_boot_record(next);
	m_record = next;

	DEBUG_INFO("BootControl::request_rollback: slot %u will be abandoned on next reset", m_record.pending_slot);
	return true;
}

void BootControl::service(uint32_t uptime_ms) {
	if (m_config.boot.confirm_policy != ConfirmPolicy::IMPLICIT_TIMEOUT || !is_trial())
		return;

	if (uptime_ms >= m_config.boot.implicit_confirm_ms) {
		DEBUG_TRACE("BootControl::service: implicit confirm after %lu ms", (unsigned long)uptime_ms);
		confirm();
	}
}
