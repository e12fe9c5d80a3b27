#pragma once

#include <cstdint>

#include "bootloader_config.hpp"
#include "boot_record.hpp"
#include "flash_commit.hpp"

// Record operations made by the running application during a trial
class BootControl {
public:
	BootControl(const BootloaderConfig &config, BootRecordStore &store, FlashCommitCoordinator &flash_commit);

	// Reloads the record; throws BOOT_RECORD_CORRUPT if none is valid
	void load();

	// Makes the trial image permanent. Returns false when there is no trial to confirm.
	bool confirm();

	// Asks the bootloader to revert on the next reset
	bool request_rollback();

	// Confirms automatically under ConfirmPolicy::IMPLICIT_TIMEOUT
	void service(uint32_t uptime_ms);

	bool is_trial() const { return m_record.status == BootStatus::TRIAL; }
	const BootRecord &record() const { return m_record; }

private:
	const BootloaderConfig &m_config;
	BootRecordStore        &m_store;
	FlashCommitCoordinator &m_flash_commit;
	BootRecord              m_record;
};
