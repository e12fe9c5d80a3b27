#include <algorithm>

#include "image_validator.hpp"
#include "crc32.hpp"
#include "debug.hpp"


const char *ImageValidator::reason_name(ValidationReason reason) {
	switch (reason) {
	case ValidationReason::FLASH_READ_ERROR: return "FLASH_READ_ERROR";
	case ValidationReason::BAD_MAGIC:        return "BAD_MAGIC";
	case ValidationReason::BAD_FOOTER_CRC:   return "BAD_FOOTER_CRC";
	case ValidationReason::SIZE_OVERFLOW:    return "SIZE_OVERFLOW";
	case ValidationReason::BAD_IMAGE_TYPE:   return "BAD_IMAGE_TYPE";
	case ValidationReason::BAD_ENTRY_POINT:  return "BAD_ENTRY_POINT";
	case ValidationReason::HASH_MISMATCH:    return "HASH_MISMATCH";
	case ValidationReason::AUTH_FAILED:      return "AUTH_FAILED";
	default:                                 return "UNKNOWN";
	}
}

bool ImageValidator::read_footer(const SlotDescriptor &slot, ImageFooter &footer) {
	return m_flash.read(footer_offset(slot.offset, slot.size), &footer, sizeof(footer)) == FLASH_OK;
}

bool ImageValidator::compute_content_crc(const SlotDescriptor &slot, uint32_t length, uint32_t &crc) {
	uint8_t buffer[READ_CHUNK_SIZE];
	uint32_t offset = 0;

	crc = 0xFFFFFFFF;
	while (offset < length) {
		uint32_t n = std::min<uint32_t>(sizeof(buffer), length - offset);
		if (m_flash.read(slot.offset + offset, buffer, n) != FLASH_OK)
			return false;
		CRC32::update(buffer, n, crc);
		offset += n;
	}
	crc ^= 0xFFFFFFFF;

	return true;
}

ValidationResult ImageValidator::validate(const SlotDescriptor &slot) {
	ImageFooter footer;

	auto invalid = [&slot](ValidationReason reason) -> ValidationResult {
		DEBUG_WARN("ImageValidator::validate: slot %u invalid: %s", slot.id, reason_name(reason));
		return InvalidImage { slot.id, reason };
	};

	if (!read_footer(slot, footer))
		return invalid(ValidationReason::FLASH_READ_ERROR);

	if (footer.magic != ImageFooter::MAGIC)
		return invalid(ValidationReason::BAD_MAGIC);

	if (footer.footer_crc != footer.compute_footer_crc())
		return invalid(ValidationReason::BAD_FOOTER_CRC);

	if (footer.image_size == 0 || footer.image_size > (slot.size - IMAGE_FOOTER_SIZE))
		return invalid(ValidationReason::SIZE_OVERFLOW);

	if (footer.image_type != static_cast<uint8_t>(ImageType::APPLICATION))
		return invalid(ValidationReason::BAD_IMAGE_TYPE);

	if (footer.entry_offset >= footer.image_size)
		return invalid(ValidationReason::BAD_ENTRY_POINT);

	uint32_t crc;
	if (!compute_content_crc(slot, footer.image_size, crc))
		return invalid(ValidationReason::FLASH_READ_ERROR);

	if (crc != footer.content_crc)
		return invalid(ValidationReason::HASH_MISMATCH);

	if (m_authenticator && !m_authenticator->authenticate(slot, footer, crc))
		return invalid(ValidationReason::AUTH_FAILED);

	DEBUG_INFO("ImageValidator::validate: slot %u valid version=%lu size=%lu", slot.id,
			   (unsigned long)footer.version, (unsigned long)footer.image_size);

	return ValidImage { slot.id, footer.version, slot.offset + footer.entry_offset, footer.image_size, crc };
}
