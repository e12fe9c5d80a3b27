#pragma once

#include <cstdint>

// Receives decoded output. A back-reference copies length bytes starting
// offset bytes behind the current end of output and may overlap itself.
class Lz4Sink {
public:
	virtual ~Lz4Sink() {}
	virtual void literal(const uint8_t *data, uint32_t length) = 0;
	virtual void backref(uint32_t offset, uint32_t length) = 0;
};

// Incremental decoder for one raw LZ4 block (no frame header, no stored size).
// Input may be fed in arbitrary pieces; every length and offset is checked
// against the output produced so far and the output limit before the sink
// sees it. Malformed input throws IMAGE_DECOMPRESS_FAILED.
class Lz4Decoder {
public:
	static inline const unsigned int MIN_MATCH = 4;

	Lz4Decoder(Lz4Sink &sink) : m_sink(sink) { reset(0); }

	// dictionary_size bytes of history precede the output and may be referenced
	void reset(uint32_t output_limit, uint32_t dictionary_size = 0);
	void feed(const uint8_t *data, uint32_t length);

	// The block must end directly after a run of literals
	void finish();

	uint32_t output_size() const { return m_output; }

private:
	enum class Stage {
		TOKEN,
		LITERAL_LENGTH,
		LITERALS,
		OFFSET_LOW,
		OFFSET_HIGH,
		MATCH_LENGTH
	};

	Lz4Sink &m_sink;
	Stage    m_stage;
	uint32_t m_output_limit;
	uint32_t m_dictionary_size;
	uint32_t m_output;
	uint32_t m_literal_length;
	uint32_t m_match_length;
	uint32_t m_offset;

	void extend(uint32_t &length, uint8_t byte);
	void begin_literals();
	void emit_match();
};
