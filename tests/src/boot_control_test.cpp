#include "boot_control.hpp"
#include "bootloader_config.hpp"
#include "boot_record.hpp"
#include "flash_commit.hpp"
#include "ram_flash.hpp"
#include "error.hpp"

#include "test_layout.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(BootControl)
{
	RamFlash *ram_flash;
	BootloaderConfig *config;
	BootRecordStore *store;
	FlashCommitCoordinator *commit;
	BootControl *control;

	void setup() {
		ram_flash = new RamFlash(SECTOR_SIZE, SECTOR_COUNT, PROG_PAGE_SIZE);
		config = new BootloaderConfig(test_layout());
		store = new BootRecordStore(*ram_flash, RECORD_OFFSET, RECORD_SECTORS, config->update.flash_retries);
		commit = new FlashCommitCoordinator(*ram_flash, *store, config->update.flash_retries);
		control = new BootControl(*config, *store, *commit);
	}

	void teardown() {
		delete control;
		delete commit;
		delete store;
		delete config;
		delete ram_flash;
	}

	void write_record(uint8_t active, uint8_t pending, BootStatus status, uint8_t trial_count = 0) {
		BootRecord r;
		r.active_slot = active;
		r.pending_slot = pending;
		r.status = status;
		r.trial_count = trial_count;
		store->commit(r);
	}

	BootRecord reload() {
		BootRecordStore reader(*ram_flash, RECORD_OFFSET, RECORD_SECTORS, 1);
		BootRecord r;
		CHECK_TRUE(RecordLoadStatus::VALID == reader.load(r));
		return r;
	}
};

TEST(BootControl, LoadRequiresValidRecord)
{
	CHECK_THROWS(ErrorCode, control->load());

	write_record(0, NO_SLOT, BootStatus::CONFIRMED);
	control->load();
	CHECK_FALSE(control->is_trial());
	CHECK_EQUAL(0, control->record().active_slot);
}

TEST(BootControl, ConfirmMakesTrialPermanent)
{
	write_record(0, 1, BootStatus::TRIAL, 1);
	control->load();
	CHECK_TRUE(control->is_trial());

	CHECK_TRUE(control->confirm());

	BootRecord r = reload();
	CHECK_EQUAL(1, r.active_slot);
	CHECK_EQUAL(NO_SLOT, r.pending_slot);
	CHECK_TRUE(BootStatus::CONFIRMED == r.status);
	CHECK_EQUAL(0, r.trial_count);
	CHECK_EQUAL(2, r.generation);
	CHECK_FALSE(control->is_trial());
}

TEST(BootControl, ConfirmWithoutTrialDoesNothing)
{
	write_record(0, NO_SLOT, BootStatus::CONFIRMED);
	control->load();

	CHECK_FALSE(control->confirm());
	CHECK_EQUAL(1, reload().generation);
}

TEST(BootControl, RequestRollbackMarksRecord)
{
	write_record(0, 1, BootStatus::TRIAL, 1);
	control->load();

	CHECK_TRUE(control->request_rollback());

	BootRecord r = reload();
	CHECK_TRUE(BootStatus::ROLLBACK_REQUESTED == r.status);
	CHECK_EQUAL(0, r.active_slot);
	CHECK_EQUAL(1, r.pending_slot);

	// Once rollback is requested the image can no longer confirm itself
	CHECK_FALSE(control->confirm());
	CHECK_FALSE(control->request_rollback());
}

TEST(BootControl, ServiceIgnoredUnderExplicitPolicy)
{
	write_record(0, 1, BootStatus::TRIAL, 1);
	control->load();

	control->service(config->boot.implicit_confirm_ms * 10);
	CHECK_TRUE(control->is_trial());
	CHECK_EQUAL(1, reload().generation);
}

TEST(BootControl, ServiceConfirmsAfterImplicitTimeout)
{
	config->boot.confirm_policy = ConfirmPolicy::IMPLICIT_TIMEOUT;
	config->boot.implicit_confirm_ms = 5000;
	write_record(0, 1, BootStatus::TRIAL, 1);
	control->load();

	control->service(4999);
	CHECK_TRUE(control->is_trial());

	control->service(5000);
	CHECK_FALSE(control->is_trial());
	CHECK_EQUAL(1, reload().active_slot);

	// Nothing further to do once confirmed
	control->service(10000);
	CHECK_EQUAL(2, reload().generation);
}
