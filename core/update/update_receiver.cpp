#include "update_receiver.hpp"
#include "error.hpp"
#include "debug.hpp"

using namespace update_state;


UpdateReceiver::UpdateReceiver(const BootloaderConfig &config, Transport &transport, FlashCommitCoordinator &flash_commit,
							   ImageValidator &validator, Logger *log) :
	m_config(config), m_transport(transport), m_flash_commit(flash_commit), m_validator(validator), m_log(log),
	m_sink(flash_commit), m_decoder(m_sink)
{
	m_slot = { NO_SLOT, 0, 0 };
}

void UpdateReceiver::log_event(UpdateEvent event, uint32_t sequence, uint32_t bytes) {
	if (!m_log)
		return;

	UpdateLogEntry entry;
	m_log->stamp(entry.header, LOG_UPDATE, sizeof(entry.event) + sizeof(entry.sequence) + sizeof(entry.bytes));
	entry.event = event;
	entry.sequence = sequence;
	entry.bytes = bytes;
	m_log->write(&entry);
}

uint32_t UpdateReceiver::last_acked() const {
	if (auto s = std::get_if<Receiving>(&m_state))
		return s->session.last_acked;
	if (auto s = std::get_if<Finalizing>(&m_state))
		return s->session.last_acked;
	return 0;
}

void UpdateReceiver::apply(StepResult &&result) {
	m_state = std::move(result.state);

	for (auto const &write : result.writes) {
		if (write.compressed)
			m_decoder.feed(write.data.data(), write.data.size());
		else
			m_flash_commit.stage_write(write.offset, write.data.data(), write.data.size());
	}

	if (result.reply.has_value() && m_transport.send(result.reply.value()) != TransportStatus::OK) {
		DEBUG_ERROR("UpdateReceiver::apply: send failed");
		throw TRANSPORT_SEND_FAILED;
	}
}

void UpdateReceiver::fail(AbortCause cause, NackReason reason) {
	uint32_t sequence = last_acked();

	m_flash_commit.abort_staging();
	StepResult result = UpdateProtocol::abort(std::move(m_state), cause, Frame::nack(sequence, reason));
	m_state = std::move(result.state);

	// Best effort; the session is over whether or not the host hears about it
	if (result.reply.has_value() && m_transport.send(result.reply.value()) != TransportStatus::OK)
		DEBUG_WARN("UpdateReceiver::fail: could not report %s to host", UpdateProtocol::cause_name(cause));
}

bool UpdateReceiver::staged_content_matches(const UpdateSession &session, const ImageFooter &footer) {
	if (!session.is_compressed())
		return footer.image_size == session.payload_size() && footer.content_crc == session.content_crc();

	m_decoder.finish();
	DEBUG_INFO("UpdateReceiver::staged_content_matches: %lu compressed bytes expanded to %lu",
			   (unsigned long)session.payload_size(), (unsigned long)m_sink.size());
	return footer.image_size == m_sink.size() && footer.content_crc == m_sink.content_crc();
}

void UpdateReceiver::finalize() {
	const UpdateSession &session = std::get<Finalizing>(m_state).session;
	ImageFooter footer;

	m_flash_commit.flush();

	if (!m_validator.read_footer(m_slot, footer) || !staged_content_matches(session, footer)) {
		DEBUG_ERROR("UpdateReceiver::finalize: staged footer does not match received stream");
		fail(AbortCause::HASH_MISMATCH, NackReason::HASH_MISMATCH);
		return;
	}

	ValidationResult result = m_validator.validate(m_slot);
	if (!ImageValidator::is_valid(result)) {
		DEBUG_ERROR("UpdateReceiver::finalize: staged image rejected: %s",
					ImageValidator::reason_name(std::get<InvalidImage>(result).reason));
		fail(AbortCause::IMAGE_INVALID, NackReason::IMAGE_INVALID);
		return;
	}

	BootRecord next = m_record;
	next.pending_slot = m_slot.id;
	next.status = BootStatus::TRIAL;
	next.trial_count = 0;
	m_flash_commit.commit_boot_record(next);

	DEBUG_INFO("UpdateReceiver::finalize: slot %u committed for trial, generation=%lu", m_slot.id,
			   (unsigned long)next.generation);
	m_record = next;

	apply(UpdateProtocol::finalized(std::move(m_state)));
}

UpdateOutcome UpdateReceiver::run(const BootRecord &record) {
	m_record = record;
	m_slot = m_config.staging_slot_for(record.active_slot);
	m_state = Idle {};

	const ProtocolLimits limits = {
		m_slot.size,
		m_config.update.reorder_window,
		m_config.update.max_chunk_size
	};

	DEBUG_INFO("UpdateReceiver::run: staging into slot %u", m_slot.id);

	while (!UpdateProtocol::is_terminal(m_state)) {
		Frame frame;
		unsigned int timeout = std::holds_alternative<Idle>(m_state) ?
				m_config.update.idle_timeout_ms : m_config.update.recv_timeout_ms;

		TransportStatus status = m_transport.recv(frame, timeout);
		if (status != TransportStatus::OK) {
			DEBUG_WARN("UpdateReceiver::run: %s in %s", status == TransportStatus::TIMEOUT ? "timeout" : "transport error",
					   UpdateProtocol::state_name(m_state));
			m_flash_commit.abort_staging();
			m_state = UpdateProtocol::abort(std::move(m_state),
					status == TransportStatus::TIMEOUT ? AbortCause::TIMEOUT : AbortCause::TRANSPORT_ERROR).state;
			continue;
		}

		DEBUG_TRACE("UpdateReceiver::run: %s kind=%u seq=%lu len=%u", UpdateProtocol::state_name(m_state),
					(unsigned int)frame.kind, (unsigned long)frame.sequence, (unsigned int)frame.payload.size());

		try {
			StepResult result = UpdateProtocol::step(std::move(m_state), frame, limits);
			bool prepare = result.prepare_staging;
			apply(std::move(result));

			if (prepare) {
				auto &negotiating = std::get<Negotiating>(m_state);
				log_event(UpdateEvent::SESSION_START, 0, negotiating.image_size);
				m_flash_commit.begin_staging(m_slot);
				m_sink.reset();
				m_decoder.reset(footer_offset(0, m_slot.size));
				apply(UpdateProtocol::staging_ready(std::move(m_state)));
			}

			if (std::holds_alternative<Finalizing>(m_state))
				finalize();
		} catch (ErrorCode e) {
			DEBUG_ERROR("UpdateReceiver::run: error %d in %s", (int)e, UpdateProtocol::state_name(m_state));
			if (e == TRANSPORT_SEND_FAILED) {
				m_flash_commit.abort_staging();
				m_state = UpdateProtocol::abort(std::move(m_state), AbortCause::TRANSPORT_ERROR).state;
			} else if (e == IMAGE_DECOMPRESS_FAILED) {
				fail(AbortCause::DECOMPRESS_FAILED, NackReason::DECOMPRESS_FAILED);
			} else {
				fail(AbortCause::FLASH_FAULT, NackReason::FLASH_FAULT);
			}
		}
	}

	if (auto committed = std::get_if<Committed>(&m_state)) {
		log_event(UpdateEvent::COMMITTED, committed->last_sequence, committed->bytes_received);
		return UpdateOutcome::COMMITTED;
	}

	auto &aborted = std::get<Aborted>(m_state);
	DEBUG_WARN("UpdateReceiver::run: session aborted: %s after %lu bytes", UpdateProtocol::cause_name(aborted.cause),
			   (unsigned long)aborted.bytes_received);
	log_event(UpdateEvent::ABORTED, static_cast<uint32_t>(aborted.cause), aborted.bytes_received);
	return UpdateOutcome::ABORTED;
}
