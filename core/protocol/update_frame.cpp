#include "update_frame.hpp"


static void put_u32(std::vector<uint8_t> &buffer, uint32_t value) {
	for (unsigned int i = 0; i < 4; i++)
		buffer.push_back((value >> (8 * i)) & 0xFF);
}

static uint32_t get_u32(const uint8_t *p) {
	return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

Frame Frame::hello(uint32_t image_size, uint32_t token, uint32_t flags) {
	Frame f;
	f.kind = FrameKind::HELLO;
	put_u32(f.payload, image_size);
	put_u32(f.payload, token);
	// The flags word is omitted for a plain transfer
	if (flags)
		put_u32(f.payload, flags);
	return f;
}

Frame Frame::data(uint32_t sequence, const std::vector<uint8_t> &chunk) {
	Frame f;
	f.kind = FrameKind::DATA;
	f.sequence = sequence;
	f.payload = chunk;
	return f;
}

Frame Frame::ack(uint32_t sequence) {
	Frame f;
	f.kind = FrameKind::ACK;
	f.sequence = sequence;
	return f;
}

Frame Frame::nack(uint32_t sequence, NackReason reason) {
	Frame f;
	f.kind = FrameKind::NACK;
	f.sequence = sequence;
	f.payload.push_back(static_cast<uint8_t>(reason));
	return f;
}

Frame Frame::abort() {
	Frame f;
	f.kind = FrameKind::ABORT;
	return f;
}

Frame Frame::done(uint32_t sequence) {
	Frame f;
	f.kind = FrameKind::DONE;
	f.sequence = sequence;
	return f;
}

bool Frame::hello_params(uint32_t &image_size, uint32_t &token) const {
	uint32_t flags;
	return hello_params(image_size, token, flags);
}

bool Frame::hello_params(uint32_t &image_size, uint32_t &token, uint32_t &flags) const {
	if (kind != FrameKind::HELLO || (payload.size() != 8 && payload.size() != 12))
		return false;
	image_size = get_u32(&payload[0]);
	token = get_u32(&payload[4]);
	flags = payload.size() == 12 ? get_u32(&payload[8]) : 0;
	return true;
}

NackReason Frame::nack_reason() const {
	if (kind != FrameKind::NACK || payload.empty())
		return NackReason::UNEXPECTED;
	return static_cast<NackReason>(payload[0]);
}
