#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "update_frame.hpp"

// Transient state of one transfer; never persisted
struct UpdateSession {
	uint32_t expected_total_size = 0;   // payload plus footer
	uint32_t bytes_received = 0;
	uint32_t running_crc = 0xFFFFFFFF;  // over payload bytes only; unused for compressed payloads
	uint32_t last_acked = 0;
	uint32_t token = 0;
	uint32_t flags = 0;
	std::map<uint32_t, std::vector<uint8_t>> reorder;

	uint32_t payload_size() const;
	uint32_t content_crc() const { return running_crc ^ 0xFFFFFFFF; }
	bool is_complete() const { return bytes_received == expected_total_size; }
	bool is_compressed() const { return flags & HELLO_FLAG_LZ4; }
};

enum class AbortCause : uint8_t {
	PEER_ABORT,
	TIMEOUT,
	TRANSPORT_ERROR,
	LENGTH_EXCEEDED,
	HASH_MISMATCH,
	IMAGE_INVALID,
	FLASH_FAULT,
	DECOMPRESS_FAILED
};

namespace update_state {
	struct Idle {};
	struct Negotiating {
		uint32_t image_size;
		uint32_t token;
		uint32_t flags;
	};
	struct Receiving {
		UpdateSession session;
	};
	struct Finalizing {
		UpdateSession session;
	};
	struct Committed {
		uint32_t last_sequence;
		uint32_t bytes_received;
	};
	struct Aborted {
		AbortCause cause;
		uint32_t   bytes_received;
	};
}

using SessionState = std::variant<update_state::Idle,
								  update_state::Negotiating,
								  update_state::Receiving,
								  update_state::Finalizing,
								  update_state::Committed,
								  update_state::Aborted>;

struct ProtocolLimits {
	uint32_t     staging_capacity;   // size of the staging slot in bytes
	unsigned int reorder_window;
	unsigned int max_chunk_size;
};

// A write into the staging slot; offset is relative to the slot start.
// Compressed payload bytes are instead handed to the decompressor and their
// offset is the position within the compressed payload.
struct FlashWrite {
	uint32_t offset;
	std::vector<uint8_t> data;
	bool compressed = false;
};

struct StepResult {
	SessionState            state;
	std::optional<Frame>    reply;
	std::vector<FlashWrite> writes;
	bool                    prepare_staging = false;
};

// Transfer state machine with no side effects. The caller performs the
// returned flash writes in order and sends the reply, if any.
class UpdateProtocol {
public:
	static StepResult step(SessionState state, const Frame &frame, const ProtocolLimits &limits);

	// Negotiating -> Receiving once the staging slot has been prepared
	static StepResult staging_ready(SessionState state);

	// Any non-terminal state -> Aborted
	static StepResult abort(SessionState state, AbortCause cause, std::optional<Frame> reply = std::nullopt);

	// Finalizing -> Committed
	static StepResult finalized(SessionState state);

	static bool is_terminal(const SessionState &state) {
		return std::holds_alternative<update_state::Committed>(state) ||
			   std::holds_alternative<update_state::Aborted>(state);
	}
	static const char *state_name(const SessionState &state);
	static const char *cause_name(AbortCause cause);

private:
	static StepResult on_idle(update_state::Idle &s, const Frame &frame, const ProtocolLimits &limits);
	static StepResult on_negotiating(update_state::Negotiating &s, const Frame &frame);
	static StepResult on_receiving(update_state::Receiving &s, const Frame &frame, const ProtocolLimits &limits);
	static StepResult on_finalizing(update_state::Finalizing &s, const Frame &frame);
	static StepResult on_committed(update_state::Committed &s, const Frame &frame);
	static StepResult on_aborted(update_state::Aborted &s, const Frame &frame);

	static void accept_chunk(UpdateSession &session, const std::vector<uint8_t> &chunk,
							 const ProtocolLimits &limits, std::vector<FlashWrite> &writes);
};
