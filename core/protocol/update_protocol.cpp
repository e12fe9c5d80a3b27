#include <algorithm>

#include "update_protocol.hpp"
#include "image_footer.hpp"
#include "crc32.hpp"

using namespace update_state;


static StepResult make_result(SessionState state, std::optional<Frame> reply = std::nullopt) {
	StepResult result;
	result.state = std::move(state);
	result.reply = std::move(reply);
	return result;
}

uint32_t UpdateSession::payload_size() const {
	return expected_total_size - IMAGE_FOOTER_SIZE;
}

const char *UpdateProtocol::state_name(const SessionState &state) {
	static const char *names[] = { "Idle", "Negotiating", "Receiving", "Finalizing", "Committed", "Aborted" };
	return names[state.index()];
}

const char *UpdateProtocol::cause_name(AbortCause cause) {
	switch (cause) {
	case AbortCause::PEER_ABORT:      return "PEER_ABORT";
	case AbortCause::TIMEOUT:         return "TIMEOUT";
	case AbortCause::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
	case AbortCause::LENGTH_EXCEEDED: return "LENGTH_EXCEEDED";
	case AbortCause::HASH_MISMATCH:   return "HASH_MISMATCH";
	case AbortCause::IMAGE_INVALID:   return "IMAGE_INVALID";
	case AbortCause::FLASH_FAULT:     return "FLASH_FAULT";
	case AbortCause::DECOMPRESS_FAILED: return "DECOMPRESS_FAILED";
	default:                          return "UNKNOWN";
	}
}

void UpdateProtocol::accept_chunk(UpdateSession &session, const std::vector<uint8_t> &chunk,
								  const ProtocolLimits &limits, std::vector<FlashWrite> &writes) {
	const uint32_t payload_size = session.payload_size();
	const uint32_t position = session.bytes_received;
	uint32_t consumed = 0;

	// Payload bytes map to the start of the slot
	if (position < payload_size) {
		consumed = std::min<uint32_t>(chunk.size(), payload_size - position);
		FlashWrite write { position, std::vector<uint8_t>(chunk.begin(), chunk.begin() + consumed) };
		if (session.is_compressed())
			write.compressed = true;
		else
			CRC32::update(chunk.data(), consumed, session.running_crc);
		writes.push_back(std::move(write));
	}

	// The trailing footer bytes map to the footer location at the end of the slot
	if (consumed < chunk.size()) {
		uint32_t footer_position = position + consumed - payload_size;
		writes.push_back({ footer_offset(0, limits.staging_capacity) + footer_position,
						   std::vector<uint8_t>(chunk.begin() + consumed, chunk.end()) });
	}

	session.bytes_received += chunk.size();
}

StepResult UpdateProtocol::on_idle(Idle &s, const Frame &frame, const ProtocolLimits &limits) {
	switch (frame.kind) {
	case FrameKind::HELLO:
	{
		uint32_t image_size, token, flags;
		if (!frame.hello_params(image_size, token, flags) || (flags & ~HELLO_FLAGS_SUPPORTED))
			return make_result(s, Frame::nack(0, NackReason::BAD_FRAME));

		if (image_size <= IMAGE_FOOTER_SIZE || image_size > limits.staging_capacity)
			return make_result(s, Frame::nack(0, NackReason::SIZE_INVALID));

		StepResult result = make_result(Negotiating { image_size, token, flags });
		result.prepare_staging = true;
		return result;
	}
	case FrameKind::DATA:
		return make_result(s, Frame::nack(frame.sequence, NackReason::NOT_NEGOTIATED));
	case FrameKind::ABORT:
		return make_result(Aborted { AbortCause::PEER_ABORT, 0 });
	default:
		return make_result(s, Frame::nack(frame.sequence, NackReason::UNEXPECTED));
	}
}

StepResult UpdateProtocol::on_negotiating(Negotiating &s, const Frame &frame) {
	if (frame.kind == FrameKind::ABORT)
		return make_result(Aborted { AbortCause::PEER_ABORT, 0 });
	return make_result(s);
}

StepResult UpdateProtocol::on_receiving(Receiving &s, const Frame &frame, const ProtocolLimits &limits) {
	UpdateSession &session = s.session;

	switch (frame.kind) {
	case FrameKind::HELLO:
	{
		uint32_t image_size, token, flags;
		if (!frame.hello_params(image_size, token, flags))
			return make_result(std::move(s), Frame::nack(0, NackReason::BAD_FRAME));
		if (token != session.token || image_size != session.expected_total_size || flags != session.flags)
			return make_result(std::move(s), Frame::nack(session.last_acked, NackReason::SESSION_MISMATCH));
		// Resume
		uint32_t last_acked = session.last_acked;
		return make_result(std::move(s), Frame::ack(last_acked));
	}

	case FrameKind::ABORT:
		return make_result(Aborted { AbortCause::PEER_ABORT, session.bytes_received });

	case FrameKind::DATA:
		break;

	default:
		return make_result(std::move(s), Frame::nack(frame.sequence, NackReason::UNEXPECTED));
	}

	uint32_t sequence = frame.sequence;

	if (frame.payload.empty() || frame.payload.size() > limits.max_chunk_size)
		return make_result(std::move(s), Frame::nack(sequence, NackReason::BAD_FRAME));

	// Already written
	if (sequence <= session.last_acked) {
		uint32_t last_acked = session.last_acked;
		return make_result(std::move(s), Frame::ack(last_acked));
	}

	if ((uint64_t)sequence > (uint64_t)session.last_acked + limits.reorder_window)
		return make_result(std::move(s), Frame::nack(sequence, NackReason::OUT_OF_WINDOW));

	if (sequence != session.last_acked + 1) {
		session.reorder.emplace(sequence, frame.payload);
		uint32_t last_acked = session.last_acked;
		return make_result(std::move(s), Frame::ack(last_acked));
	}

	std::vector<FlashWrite> writes;
	std::vector<uint8_t> chunk = frame.payload;

	while (true) {
		if (session.bytes_received + chunk.size() > session.expected_total_size)
			return make_result(Aborted { AbortCause::LENGTH_EXCEEDED, session.bytes_received },
							   Frame::nack(sequence, NackReason::LENGTH_EXCEEDED));

		accept_chunk(session, chunk, limits, writes);
		session.last_acked = sequence;

		if (session.is_complete()) {
			session.reorder.clear();
			StepResult result = make_result(Finalizing { std::move(session) });
			result.writes = std::move(writes);
			return result;
		}

		auto next = session.reorder.find(session.last_acked + 1);
		if (next == session.reorder.end())
			break;
		sequence = next->first;
		chunk = std::move(next->second);
		session.reorder.erase(next);
	}

	uint32_t last_acked = session.last_acked;
	StepResult result = make_result(std::move(s), Frame::ack(last_acked));
	result.writes = std::move(writes);
	return result;
}

StepResult UpdateProtocol::on_finalizing(Finalizing &s, const Frame &frame) {
	if (frame.kind == FrameKind::ABORT)
		return make_result(Aborted { AbortCause::PEER_ABORT, s.session.bytes_received });
	return make_result(std::move(s));
}

StepResult UpdateProtocol::on_committed(Committed &s, const Frame &frame) {
	// The peer may have missed DONE
	if (frame.kind == FrameKind::DATA || frame.kind == FrameKind::HELLO)
		return make_result(s, Frame::done(s.last_sequence));
	return make_result(s);
}

StepResult UpdateProtocol::on_aborted(Aborted &s, const Frame &) {
	return make_result(s);
}

StepResult UpdateProtocol::step(SessionState state, const Frame &frame, const ProtocolLimits &limits) {
	if (auto s = std::get_if<Idle>(&state))
		return on_idle(*s, frame, limits);
	if (auto s = std::get_if<Negotiating>(&state))
		return on_negotiating(*s, frame);
	if (auto s = std::get_if<Receiving>(&state))
		return on_receiving(*s, frame, limits);
	if (auto s = std::get_if<Finalizing>(&state))
		return on_finalizing(*s, frame);
	if (auto s = std::get_if<Committed>(&state))
		return on_committed(*s, frame);
	return on_aborted(std::get<Aborted>(state), frame);
}

StepResult UpdateProtocol::staging_ready(SessionState state) {
	auto s = std::get_if<Negotiating>(&state);
	if (!s)
		return make_result(std::move(state));

	UpdateSession session;
	session.expected_total_size = s->image_size;
	session.token = s->token;
	session.flags = s->flags;
	return make_result(Receiving { std::move(session) }, Frame::ack(0));
}

StepResult UpdateProtocol::abort(SessionState state, AbortCause cause, std::optional<Frame> reply) {
	if (is_terminal(state))
		return make_result(std::move(state));

	uint32_t bytes_received = 0;
	if (auto s = std::get_if<Receiving>(&state))
		bytes_received = s->session.bytes_received;
	else if (auto s = std::get_if<Finalizing>(&state))
		bytes_received = s->session.bytes_received;

	return make_result(Aborted { cause, bytes_received }, std::move(reply));
}

StepResult UpdateProtocol::finalized(SessionState state) {
	auto s = std::get_if<Finalizing>(&state);
	if (!s)
		return make_result(std::move(state));

	uint32_t last_sequence = s->session.last_acked;
	return make_result(Committed { last_sequence, s->session.bytes_received }, Frame::done(last_sequence));
}
