#include "bootloader_config.hpp"
#include "update_frame.hpp"
#include "error.hpp"

#include "test_layout.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(BootloaderConfig)
{
	FlashLayout layout;

	void setup() {
		layout = test_layout();
	}

	void teardown() {
	}
};

TEST(BootloaderConfig, DefaultsAreValid)
{
	BootloaderConfig config(layout);
	config.validate();

	CHECK_EQUAL(BootloaderConfig::DEFAULT_MAX_TRIAL_COUNT, config.boot.max_trial_count);
	CHECK_TRUE(ConfirmPolicy::EXPLICIT == config.boot.confirm_policy);
	CHECK_EQUAL(2, config.boot.recover_priority.size());
	CHECK_EQUAL(0, config.boot.recover_priority[0]);
	CHECK_EQUAL(1, config.boot.recover_priority[1]);
	CHECK_EQUAL(2 * SECTOR_SIZE, config.record_region_size());
}

TEST(BootloaderConfig, StagingSlotIsTheInactiveOne)
{
	BootloaderConfig config(layout);
	CHECK_EQUAL(1, config.staging_slot_for(0).id);
	CHECK_EQUAL(0, config.staging_slot_for(1).id);
	CHECK_TRUE(config.find_slot(1) != nullptr);
	POINTERS_EQUAL(nullptr, config.find_slot(7));
}

TEST(BootloaderConfig, SingleSlotIsRejected)
{
	layout.slots.pop_back();
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, OverlappingSlotsAreRejected)
{
	layout.slots[1].offset = SLOT_0_OFFSET + SECTOR_SIZE;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, SlotOverlappingRecordIsRejected)
{
	layout.slots[1].size = SLOT_SIZE + SECTOR_SIZE;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, MisalignedSlotIsRejected)
{
	layout.slots[1].offset += 4;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, SlotBeyondDeviceIsRejected)
{
	layout.slots[1].offset = (SECTOR_COUNT - 1) * SECTOR_SIZE;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, RecordRegionNeedsTwoSectors)
{
	layout.record_sectors = 1;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, DuplicateSlotIdIsRejected)
{
	layout.slots[1].id = 0;
	BootloaderConfig config(layout);
	CHECK_THROWS(ErrorCode, config.validate());
}

TEST(BootloaderConfig, BadPolicyValuesAreRejected)
{
	BootloaderConfig zero_trials(layout);
	zero_trials.boot.max_trial_count = 0;
	CHECK_THROWS(ErrorCode, zero_trials.validate());

	BootloaderConfig wide_trials(layout);
	wide_trials.boot.max_trial_count = UINT8_MAX + 1;
	CHECK_THROWS(ErrorCode, wide_trials.validate());
	wide_trials.boot.max_trial_count = UINT8_MAX;
	wide_trials.validate();

	BootloaderConfig big_chunks(layout);
	big_chunks.update.max_chunk_size = FRAME_MAX_PAYLOAD + 1;
	CHECK_THROWS(ErrorCode, big_chunks.validate());

	BootloaderConfig unknown_slot(layout);
	unknown_slot.boot.recover_priority.push_back(9);
	CHECK_THROWS(ErrorCode, unknown_slot.validate());
}
