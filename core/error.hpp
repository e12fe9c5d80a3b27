#pragma once

enum ErrorCode : int {
	BAD_CONFIGURATION = 1,
	FLASH_READ_FAILED,
	FLASH_ERASE_FAILED,
	FLASH_VERIFY_FAILED,
	FLASH_OUT_OF_RANGE,
	STAGING_OUT_OF_RANGE,
	STAGING_NOT_STARTED,
	BOOT_RECORD_CORRUPT,
	BOOT_RECORD_INVALID,
	BOOT_RECORD_LOG_FULL,
	BOOT_SLOT_INVALID,
	NO_BOOTABLE_IMAGE,
	UPDATE_SESSION_FAILED,
	TRANSPORT_SEND_FAILED,
	FRAME_TOO_LARGE,
	IMAGE_DECOMPRESS_FAILED,
};
