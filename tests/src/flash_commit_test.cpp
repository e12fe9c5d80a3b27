#include <algorithm>
#include <cstring>
#include <functional>
#include <vector>

#include "flash_commit.hpp"
#include "boot_record.hpp"
#include "ram_flash.hpp"
#include "image_footer.hpp"
#include "error.hpp"

#include "test_layout.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"

#define RETRIES (3)

// Counts device operations and can silently drop programs or leave erase residue
class CountingFlash : public RamFlash {
public:
	std::vector<uint32_t> m_erased_sectors;
	std::vector<std::pair<uint32_t, uint32_t>> m_progs;
	unsigned int m_dropped_progs = 0;
	bool m_erase_leaves_residue = false;

	CountingFlash() : RamFlash(SECTOR_SIZE, SECTOR_COUNT, PROG_PAGE_SIZE) {}

	int prog(uint32_t offset, const void *buffer, uint32_t size) override {
		m_progs.push_back({ offset, size });
		if (m_dropped_progs) {
			m_dropped_progs--;
			return FLASH_OK;
		}
		return RamFlash::prog(offset, buffer, size);
	}

	int erase(uint32_t sector) override {
		m_erased_sectors.push_back(sector);
		int ret = RamFlash::erase(sector);
		if (m_erase_leaves_residue)
			m_ram[sector * m_sector_size + 17] = 0x00;
		return ret;
	}

	unsigned int erase_count(uint32_t sector) {
		unsigned int n = 0;
		for (auto s : m_erased_sectors)
			if (s == sector)
				n++;
		return n;
	}
};

static ErrorCode error_from(std::function<void()> op) {
	try {
		op();
	} catch (ErrorCode e) {
		return e;
	}
	FAIL("expected an ErrorCode");
	return BAD_CONFIGURATION;
}


TEST_GROUP(FlashCommit)
{
	CountingFlash *flash;
	BootRecordStore *store;
	FlashCommitCoordinator *commit;
	SlotDescriptor slot1;

	void setup() {
		flash = new CountingFlash;
		store = new BootRecordStore(*flash, RECORD_OFFSET, RECORD_SECTORS, RETRIES);
		commit = new FlashCommitCoordinator(*flash, *store, RETRIES);
		slot1 = { 1, SLOT_1_OFFSET, SLOT_SIZE };
	}

	void teardown() {
		delete commit;
		delete store;
		delete flash;
	}

	uint32_t first_sector() { return SLOT_1_OFFSET / SECTOR_SIZE; }
	uint32_t last_sector() { return (SLOT_1_OFFSET + SLOT_SIZE) / SECTOR_SIZE - 1; }
};

TEST(FlashCommit, BeginStagingErasesFooterSectorFirst)
{
	// Stale footer from a previous image
	std::memset(&flash->data()[footer_offset(SLOT_1_OFFSET, SLOT_SIZE)], 0x00, IMAGE_FOOTER_SIZE);

	commit->begin_staging(slot1);

	CHECK_EQUAL(1, flash->m_erased_sectors.size());
	CHECK_EQUAL(last_sector(), flash->m_erased_sectors[0]);
	CHECK_EQUAL(0xFF, flash->data()[footer_offset(SLOT_1_OFFSET, SLOT_SIZE)]);
}

TEST(FlashCommit, SectorsAreErasedLazilyOncePerSession)
{
	std::memset(&flash->data()[SLOT_1_OFFSET], 0x00, SLOT_SIZE);
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(100, 0x5A);
	for (uint32_t offset = 0; offset < 2 * SECTOR_SIZE; offset += data.size())
		commit->stage_write(offset, data.data(), std::min<uint32_t>(data.size(), 2 * SECTOR_SIZE - offset));
	commit->flush();

	CHECK_EQUAL(1, flash->erase_count(first_sector()));
	CHECK_EQUAL(1, flash->erase_count(first_sector() + 1));
	CHECK_EQUAL(0, flash->erase_count(first_sector() + 2));
	CHECK_EQUAL(0x5A, flash->data()[SLOT_1_OFFSET]);
	CHECK_EQUAL(0x5A, flash->data()[SLOT_1_OFFSET + 2 * SECTOR_SIZE - 1]);
	CHECK_EQUAL(0x00, flash->data()[SLOT_1_OFFSET + 2 * SECTOR_SIZE]);
}

TEST(FlashCommit, WritesAreBatchedIntoPages)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(16, 0xA5);
	for (uint32_t offset = 0; offset < PROG_PAGE_SIZE; offset += data.size())
		commit->stage_write(offset, data.data(), data.size());
	CHECK_EQUAL(0, flash->m_progs.size());

	commit->flush();
	CHECK_EQUAL(1, flash->m_progs.size());
	CHECK_EQUAL(SLOT_1_OFFSET, flash->m_progs[0].first);
	CHECK_EQUAL(PROG_PAGE_SIZE, flash->m_progs[0].second);
}

TEST(FlashCommit, OnlyDirtyRangeOfPageIsProgrammed)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(10, 0x11);
	commit->stage_write(40, data.data(), data.size());
	commit->stage_write(60, data.data(), data.size());
	commit->flush();

	CHECK_EQUAL(1, flash->m_progs.size());
	CHECK_EQUAL(SLOT_1_OFFSET + 40, flash->m_progs[0].first);
	CHECK_EQUAL(30, flash->m_progs[0].second);
}

TEST(FlashCommit, WriteSpanningPagesIsSplit)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(PROG_PAGE_SIZE, 0x22);
	commit->stage_write(PROG_PAGE_SIZE / 2, data.data(), data.size());
	commit->flush();

	CHECK_EQUAL(2, flash->m_progs.size());
	CHECK_EQUAL(SLOT_1_OFFSET + PROG_PAGE_SIZE / 2, flash->m_progs[0].first);
	CHECK_EQUAL(PROG_PAGE_SIZE / 2, flash->m_progs[0].second);
	CHECK_EQUAL(SLOT_1_OFFSET + PROG_PAGE_SIZE, flash->m_progs[1].first);
	CHECK_EQUAL(PROG_PAGE_SIZE / 2, flash->m_progs[1].second);
}

TEST(FlashCommit, ProgramIsVerifiedAndRetried)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(32, 0x6C);
	flash->m_dropped_progs = 1;
	commit->stage_write(0, data.data(), data.size());
	commit->flush();

	CHECK_EQUAL(2, flash->m_progs.size());
	CHECK_EQUAL(0x6C, flash->data()[SLOT_1_OFFSET + 31]);
}

TEST(FlashCommit, ProgramVerifyFailureIsReported)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> data(32, 0x7E);
	flash->m_dropped_progs = RETRIES;
	commit->stage_write(0, data.data(), data.size());

	CHECK_EQUAL(FLASH_VERIFY_FAILED, error_from([this]() { commit->flush(); }));
	CHECK_EQUAL(RETRIES, flash->m_progs.size());
}

TEST(FlashCommit, BlankCheckFailureAfterEraseIsReported)
{
	flash->m_erase_leaves_residue = true;
	CHECK_EQUAL(FLASH_ERASE_FAILED, error_from([this]() { commit->begin_staging(slot1); }));
}

TEST(FlashCommit, WritesOutsideSlotAreRejected)
{
	commit->begin_staging(slot1);

	uint8_t byte = 0;
	CHECK_EQUAL(STAGING_OUT_OF_RANGE, error_from([&]() { commit->stage_write(SLOT_SIZE, &byte, 1); }));
	CHECK_EQUAL(STAGING_OUT_OF_RANGE, error_from([&]() { commit->stage_write(SLOT_SIZE - 1, &byte, 2); }));
	commit->stage_write(SLOT_SIZE - 1, &byte, 1);
}

TEST(FlashCommit, WriteBeforeStagingIsRejected)
{
	uint8_t byte = 0;
	CHECK_EQUAL(STAGING_NOT_STARTED, error_from([&]() { commit->stage_write(0, &byte, 1); }));
}

TEST(FlashCommit, AbortDiscardsUnflushedData)
{
	commit->begin_staging(slot1);
	std::vector<uint8_t> data(8, 0x33);
	commit->stage_write(0, data.data(), data.size());
	commit->abort_staging();
	commit->flush();

	CHECK_EQUAL(0, flash->m_progs.size());
	CHECK_FALSE(commit->is_staging());
}

TEST(FlashCommit, CommitBootRecordFlushesStagedDataFirst)
{
	commit->begin_staging(slot1);
	std::vector<uint8_t> data(8, 0x44);
	commit->stage_write(0, data.data(), data.size());

	BootRecord r;
	r.active_slot = 0;
	r.pending_slot = 1;
	r.status = BootStatus::TRIAL;
	commit->commit_boot_record(r);

	CHECK_EQUAL(2, flash->m_progs.size());
	CHECK_EQUAL(SLOT_1_OFFSET, flash->m_progs[0].first);
	CHECK_EQUAL(RECORD_OFFSET, flash->m_progs[1].first);
	CHECK_EQUAL(1, r.generation);

	BootRecord loaded;
	CHECK_TRUE(RecordLoadStatus::VALID == store->load(loaded));
	CHECK_TRUE(loaded == r);
}

TEST(FlashCommit, ReadStagedSeesBufferedAndProgrammedBytes)
{
	commit->begin_staging(slot1);

	std::vector<uint8_t> first(PROG_PAGE_SIZE, 0x11);
	std::vector<uint8_t> second(40, 0x22);
	commit->stage_write(0, first.data(), first.size());
	commit->stage_write(PROG_PAGE_SIZE, second.data(), second.size());

	// The first page has been programmed, the second is still buffered
	CHECK_EQUAL(1, flash->m_progs.size());
	CHECK_EQUAL(0xFF, flash->data()[SLOT_1_OFFSET + PROG_PAGE_SIZE]);

	uint8_t readback[64];
	commit->read_staged(PROG_PAGE_SIZE - 24, readback, sizeof(readback));
	for (unsigned int i = 0; i < 24; i++)
		CHECK_EQUAL(0x11, readback[i]);
	for (unsigned int i = 24; i < 64; i++)
		CHECK_EQUAL(0x22, readback[i]);
}

TEST(FlashCommit, ReadStagedRequiresSessionAndBounds)
{
	uint8_t readback[8];
	CHECK_EQUAL(STAGING_NOT_STARTED, error_from([&]() { commit->read_staged(0, readback, sizeof(readback)); }));

	commit->begin_staging(slot1);
	CHECK_EQUAL(STAGING_OUT_OF_RANGE, error_from([&]() { commit->read_staged(SLOT_SIZE - 4, readback, sizeof(readback)); }));
}
