#pragma once

#include <cstdint>
#include <variant>

#include "flash_interface.hpp"
#include "bootloader_config.hpp"
#include "image_footer.hpp"

enum class ValidationReason : uint8_t {
	FLASH_READ_ERROR = 1,
	BAD_MAGIC,
	BAD_FOOTER_CRC,
	SIZE_OVERFLOW,
	BAD_IMAGE_TYPE,
	BAD_ENTRY_POINT,
	HASH_MISMATCH,
	AUTH_FAILED
};

struct ValidImage {
	uint8_t  slot;
	uint32_t version;
	uint32_t entry_point;
	uint32_t image_size;
	uint32_t content_crc;
};

struct InvalidImage {
	uint8_t          slot;
	ValidationReason reason;
};

using ValidationResult = std::variant<ValidImage, InvalidImage>;

// Optional authenticity check run after the content hash has matched.
// The signature scheme itself is provided by the platform.
class ImageAuthenticator {
public:
	virtual ~ImageAuthenticator() {}
	virtual bool authenticate(const SlotDescriptor &slot, const ImageFooter &footer, uint32_t content_crc) = 0;
};

class ImageValidator {
public:
	ImageValidator(FlashInterface &flash, ImageAuthenticator *authenticator = nullptr) :
		m_flash(flash), m_authenticator(authenticator) {}

	// Read-only; every failure is reported through InvalidImage
	ValidationResult validate(const SlotDescriptor &slot);

	bool read_footer(const SlotDescriptor &slot, ImageFooter &footer);

	static bool is_valid(const ValidationResult &result) {
		return std::holds_alternative<ValidImage>(result);
	}
	static const char *reason_name(ValidationReason reason);

private:
	static inline const unsigned int READ_CHUNK_SIZE = 256;

	FlashInterface     &m_flash;
	ImageAuthenticator *m_authenticator;

	bool compute_content_crc(const SlotDescriptor &slot, uint32_t length, uint32_t &crc);
};
