#pragma once

#include <cstdio>
#include <string>

#include "ram_flash.hpp"

// RamFlash persisted to a host file on every sync()
class FileFlash : public RamFlash {
private:
	std::string m_path;

public:
	FileFlash(const std::string &path, unsigned int sector_size, unsigned int sectors, unsigned int page_size) :
		RamFlash(sector_size, sectors, page_size), m_path(path) {}

	// Returns false if an existing image could not be read
	bool load() {
		FILE *f = fopen(m_path.c_str(), "rb");
		if (!f)
			return true;
		size_t n = fread(m_ram, 1, size(), f);
		fclose(f);
		return n == size();
	}

	int sync() override {
		FILE *f = fopen(m_path.c_str(), "wb");
		if (!f)
			return FLASH_ERR_IO;
		size_t n = fwrite(m_ram, 1, size(), f);
		if (fclose(f) != 0 || n != size())
			return FLASH_ERR_IO;
		return FLASH_OK;
	}
};
