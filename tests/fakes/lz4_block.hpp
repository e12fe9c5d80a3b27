#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// Builds raw LZ4 blocks for tests, either sequence by sequence or with a
// greedy longest-match search over dictionary || data
struct Lz4Block {
	std::vector<uint8_t> bytes;

	Lz4Block &sequence(const uint8_t *literals, uint32_t literal_length, uint16_t offset, uint32_t match_length) {
		uint32_t match_code = match_length - 4;
		bytes.push_back((std::min<uint32_t>(literal_length, 15) << 4) | std::min<uint32_t>(match_code, 15));
		put_length(literal_length);
		bytes.insert(bytes.end(), literals, literals + literal_length);
		bytes.push_back(offset & 0xFF);
		bytes.push_back(offset >> 8);
		put_length(match_code);
		return *this;
	}

	Lz4Block &last(const uint8_t *literals, uint32_t literal_length) {
		bytes.push_back(std::min<uint32_t>(literal_length, 15) << 4);
		put_length(literal_length);
		bytes.insert(bytes.end(), literals, literals + literal_length);
		return *this;
	}

	static std::vector<uint8_t> compress(const std::vector<uint8_t> &data, const std::vector<uint8_t> &dictionary = {}) {
		std::vector<uint8_t> history(dictionary);
		history.insert(history.end(), data.begin(), data.end());

		// The final five bytes are always literals
		const uint32_t end = history.size();
		const uint32_t match_end = end > 5 ? end - 5 : 0;
		uint32_t anchor = dictionary.size();
		uint32_t pos = anchor;
		Lz4Block block;

		while (pos < match_end) {
			uint32_t best_length = 0;
			uint32_t best_offset = 0;
			uint32_t first = pos > 65535 ? pos - 65535 : 0;
			for (uint32_t candidate = first; candidate < pos; candidate++) {
				uint32_t n = 0;
				while (pos + n < match_end && history[candidate + n] == history[pos + n])
					n++;
				if (n > best_length) {
					best_length = n;
					best_offset = pos - candidate;
				}
			}

			if (best_length >= 4) {
				block.sequence(&history[anchor], pos - anchor, best_offset, best_length);
				pos += best_length;
				anchor = pos;
			} else {
				pos++;
			}
		}

		block.last(history.data() + anchor, end - anchor);
		return block.bytes;
	}

private:
	void put_length(uint32_t length) {
		if (length < 15)
			return;
		length -= 15;
		while (length >= 255) {
			bytes.push_back(255);
			length -= 255;
		}
		bytes.push_back(length);
	}
};

static inline std::vector<uint8_t> lz4_bytes(const std::string &s) {
	return std::vector<uint8_t>(s.begin(), s.end());
}
