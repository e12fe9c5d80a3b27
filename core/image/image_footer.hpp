#pragma once

#include <cstdint>
#include <cstddef>

#include "crc32.hpp"

enum class ImageType : uint8_t {
	APPLICATION = 1
};

// Trailing metadata stored in the last bytes of every slot
struct __attribute__((packed)) ImageFooter {
	static constexpr const uint32_t MAGIC = 0x474D4946;   // "FIMG"

	uint32_t magic;
	uint32_t image_size;
	uint32_t version;
	uint32_t entry_offset;
	uint8_t  image_type;
	uint8_t  reserved[3];
	uint32_t content_crc;
	uint32_t reserved2;
	uint32_t footer_crc;

	uint32_t compute_footer_crc() const {
		return CRC32::checksum(reinterpret_cast<const uint8_t *>(this), offsetof(ImageFooter, footer_crc));
	}

	void seal() {
		footer_crc = compute_footer_crc();
	}

	static ImageFooter make(uint32_t image_size, uint32_t version, uint32_t entry_offset, uint32_t content_crc) {
		ImageFooter footer;
		footer.magic = MAGIC;
		footer.image_size = image_size;
		footer.version = version;
		footer.entry_offset = entry_offset;
		footer.image_type = static_cast<uint8_t>(ImageType::APPLICATION);
		footer.reserved[0] = footer.reserved[1] = footer.reserved[2] = 0xFF;
		footer.content_crc = content_crc;
		footer.reserved2 = 0xFFFFFFFF;
		footer.seal();
		return footer;
	}
};

static_assert(sizeof(ImageFooter) == 32, "ImageFooter layout is fixed");

static constexpr const uint32_t IMAGE_FOOTER_SIZE = sizeof(ImageFooter);

static inline uint32_t footer_offset(uint32_t slot_offset, uint32_t slot_size) {
	return slot_offset + slot_size - IMAGE_FOOTER_SIZE;
}
