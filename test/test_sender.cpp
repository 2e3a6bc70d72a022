#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "unity.h"
#include "helpers.h"
#include "sender.hpp"
#include "sim_transport.hpp"

static std::unique_ptr<SimLink> simLink;
static std::unique_ptr<Session> senderSession;
static std::unique_ptr<Session> peer;

void setUp(void) {
  simLink = std::make_unique<SimLink>();
  senderSession = simLink->open(SENDER_ADDR);
  peer = simLink->open(RECEIVER_ADDR);
}

void tearDown(void) {
  peer.reset();
  senderSession.reset();
  simLink.reset();
}

// 1000 bytes in 200 byte chunks, bulk burst already drained from the peer
static void startTransfer(FileSender& sender) {
  sender.begin(sampleData(1000), SAMPLE_FILE_ID);
  sender.transmit_all();
  drainFrames(*peer);
}

static void assertDataSeqs(const std::vector<ProtocolPacket>& packets, const std::vector<uint16_t>& seqs) {
  std::vector<uint16_t> sent;
  for (const ProtocolPacket& pkt : packets) {
    if (pkt.kind == PacketKind::Data) sent.push_back(pkt.seq);
  }
  TEST_ASSERT_EQUAL(seqs.size(), sent.size());
  for (size_t i = 0; i < seqs.size(); i++) {
    TEST_ASSERT_EQUAL(seqs[i], sent[i]);
  }
}

void test_bulk_send_emits_every_chunk_then_end(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  std::vector<uint8_t> data = sampleData(1000);

  sender.begin(data, SAMPLE_FILE_ID);
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Init), static_cast<int>(sender.state()));
  TEST_ASSERT_EQUAL(5, sender.total_chunks());

  sender.transmit_all();
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::AwaitFeedback), static_cast<int>(sender.state()));

  std::vector<ProtocolPacket> packets = drainPackets(*peer);
  TEST_ASSERT_EQUAL(6, packets.size());
  assertDataSeqs(packets, {0, 1, 2, 3, 4});

  for (size_t i = 0; i < 5; i++) {
    TEST_ASSERT_EQUAL_HEX16(SAMPLE_FILE_ID, packets[i].file_id);
    TEST_ASSERT_EQUAL(200, packets[i].payload.size());
    TEST_ASSERT_EQUAL_UINT8_ARRAY(data.data() + i * 200, packets[i].payload.data(), 200);
  }

  TEST_ASSERT_EQUAL(static_cast<int>(PacketKind::End), static_cast<int>(packets[5].kind));
  TEST_ASSERT_EQUAL(5, packets[5].total_chunks);
  TEST_ASSERT_EQUAL(5, sender.tracker().packets_sent());
}

void test_ack_completes_transfer(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  TEST_ASSERT_TRUE(sender.on_packet(RECEIVER_ADDR, make_ack_packet(SAMPLE_FILE_ID)));

  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Done), static_cast<int>(sender.state()));
  SendResult result = sender.result();
  TEST_ASSERT_TRUE(result.success);
  TEST_ASSERT_EQUAL(0, result.rounds);
  TEST_ASSERT_EQUAL(0, result.residual_missing);
  TEST_ASSERT_EQUAL(0, drainFrames(*peer).size());
}

void test_empty_nack_completes_transfer(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {}));

  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Done), static_cast<int>(sender.state()));
  TEST_ASSERT_TRUE(sender.result().success);
}

void test_nack_retransmits_only_listed_chunks(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  TEST_ASSERT_TRUE(sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {2})));

  std::vector<ProtocolPacket> packets = drainPackets(*peer);
  TEST_ASSERT_EQUAL(3, packets.size());

  // the NACK is acknowledged before the retransmission
  TEST_ASSERT_EQUAL(static_cast<int>(PacketKind::Ack), static_cast<int>(packets[0].kind));
  TEST_ASSERT_EQUAL_HEX16(SAMPLE_FILE_ID, packets[0].file_id);
  assertDataSeqs(packets, {2});
  TEST_ASSERT_EQUAL(static_cast<int>(PacketKind::End), static_cast<int>(packets[2].kind));

  TEST_ASSERT_EQUAL(1, sender.rounds());
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::AwaitFeedback), static_cast<int>(sender.state()));
  TEST_ASSERT_EQUAL(1, sender.tracker().unconfirmed_count());
  TEST_ASSERT_FALSE(sender.tracker().is_confirmed(2));
  TEST_ASSERT_TRUE(sender.tracker().is_confirmed(4));
  TEST_ASSERT_EQUAL(1, sender.tracker().retransmissions());
}

void test_nack_entries_beyond_total_are_skipped(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {1, 7, 1}));

  assertDataSeqs(drainPackets(*peer), {1});
}

void test_feedback_for_other_transfers_is_ignored(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  TEST_ASSERT_FALSE(sender.on_packet(RECEIVER_ADDR, make_nack_packet(0x4321, {0, 1})));
  TEST_ASSERT_FALSE(sender.on_packet(RECEIVER_ADDR, make_ack_packet(0x4321)));
  TEST_ASSERT_FALSE(sender.on_packet(OTHER_ADDR, make_ack_packet(SAMPLE_FILE_ID)));
  TEST_ASSERT_FALSE(sender.on_packet(RECEIVER_ADDR, make_end_packet(SAMPLE_FILE_ID, 5)));

  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::AwaitFeedback), static_cast<int>(sender.state()));
  TEST_ASSERT_EQUAL(0, drainFrames(*peer).size());
}

void test_malformed_feedback_is_dropped(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  Frame frame;
  frame.source = RECEIVER_ADDR;
  frame.payload = {0xDD, 0x12, 0x34, 0x00, 0x05};

  TEST_ASSERT_FALSE(sender.on_frame(frame));
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::AwaitFeedback), static_cast<int>(sender.state()));
}

void test_round_cap_ends_in_failure(void) {
  ProtocolConfig config = fastConfig();
  config.max_retry_rounds = 3;
  FileSender sender(*senderSession, RECEIVER_ADDR, config);
  startTransfer(sender);

  for (unsigned round = 1; round <= 3; round++) {
    sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {2}));
    TEST_ASSERT_EQUAL(round, sender.rounds());
    assertDataSeqs(drainPackets(*peer), {2});
  }

  // budget spent: the next NACK fails the transfer without sending anything
  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {2}));

  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Failed), static_cast<int>(sender.state()));
  TEST_ASSERT_EQUAL(0, drainFrames(*peer).size());

  SendResult result = sender.result();
  TEST_ASSERT_FALSE(result.success);
  TEST_ASSERT_EQUAL(3, result.rounds);
  TEST_ASSERT_EQUAL(1, result.residual_missing);
}

void test_timeout_resends_end_then_unconfirmed_chunks(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  // first silence: END may have been lost
  sender.on_timeout();
  std::vector<ProtocolPacket> packets = drainPackets(*peer);
  TEST_ASSERT_EQUAL(1, packets.size());
  TEST_ASSERT_EQUAL(static_cast<int>(PacketKind::End), static_cast<int>(packets[0].kind));
  TEST_ASSERT_EQUAL(0, sender.rounds());

  // still silent: nothing confirmed yet, so everything goes again
  sender.on_timeout();
  packets = drainPackets(*peer);
  assertDataSeqs(packets, {0, 1, 2, 3, 4});
  TEST_ASSERT_EQUAL(static_cast<int>(PacketKind::End), static_cast<int>(packets.back().kind));
  TEST_ASSERT_EQUAL(1, sender.rounds());
}

void test_lost_round_resends_only_what_no_nack_confirmed(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  startTransfer(sender);

  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {1, 3}));
  drainFrames(*peer);

  sender.on_timeout();
  drainFrames(*peer);
  sender.on_timeout();

  assertDataSeqs(drainPackets(*peer), {1, 3});
  TEST_ASSERT_EQUAL(2, sender.rounds());
}

void test_full_nack_confirms_nothing(void) {
  ProtocolConfig config = fastConfig();
  config.max_nack_entries = 2;
  FileSender sender(*senderSession, RECEIVER_ADDR, config);
  startTransfer(sender);

  // as long as the cap: possibly truncated
  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {0, 1}));
  TEST_ASSERT_EQUAL(5, sender.tracker().unconfirmed_count());
  drainFrames(*peer);

  // shorter than the cap: complete
  sender.on_packet(RECEIVER_ADDR, make_nack_packet(SAMPLE_FILE_ID, {4}));
  TEST_ASSERT_EQUAL(1, sender.tracker().unconfirmed_count());
}

void test_silent_receiver_fails_after_round_cap(void) {
  ProtocolConfig config = fastConfig();
  config.nack_timeout = std::chrono::milliseconds(30);
  config.max_retry_rounds = 2;
  FileSender sender(*senderSession, RECEIVER_ADDR, config);

  SendResult result = sender.send(sampleData(500));

  TEST_ASSERT_FALSE(result.success);
  TEST_ASSERT_FALSE(result.interrupted);
  TEST_ASSERT_EQUAL(2, result.rounds);
  TEST_ASSERT_EQUAL(3, result.total_chunks);
  TEST_ASSERT_EQUAL(3, result.residual_missing);
  TEST_ASSERT_TRUE(result.file_id >= FILE_ID_MIN && result.file_id <= FILE_ID_MAX);

  // bulk burst plus two full retransmissions
  std::vector<ProtocolPacket> packets = drainPackets(*peer);
  TEST_ASSERT_EQUAL(9, countKind(packets, PacketKind::Data));
}

void test_stop_flag_interrupts_send(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  std::atomic<bool> stop(true);

  SendResult result = sender.send(sampleData(1000), &stop);

  TEST_ASSERT_FALSE(result.success);
  TEST_ASSERT_TRUE(result.interrupted);
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Failed), static_cast<int>(sender.state()));
  TEST_ASSERT_EQUAL(0, countKind(drainPackets(*peer), PacketKind::Data));
}

void test_transport_error_fails_and_propagates(void) {
  FileSender sender(*senderSession, RECEIVER_ADDR, fastConfig());
  senderSession->close();

  bool threw = false;
  try {
    sender.send(sampleData(100));
  } catch (const TransportError&) {
    threw = true;
  }
  TEST_ASSERT_TRUE(threw);
  TEST_ASSERT_EQUAL(static_cast<int>(SenderState::Failed), static_cast<int>(sender.state()));
}

void test_file_too_large_is_rejected_before_sending(void) {
  ProtocolConfig config = fastConfig();
  config.chunk_size = 1;
  FileSender sender(*senderSession, RECEIVER_ADDR, config);

  bool threw = false;
  try {
    sender.send(std::vector<uint8_t>(65536, 0xAB));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  TEST_ASSERT_TRUE(threw);
  TEST_ASSERT_EQUAL(0, drainFrames(*peer).size());
}

void test_invalid_config_is_rejected(void) {
  ProtocolConfig config = fastConfig();
  config.chunk_size = MAX_CHUNK_SIZE + 1;

  bool threw = false;
  try {
    FileSender sender(*senderSession, RECEIVER_ADDR, config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  TEST_ASSERT_TRUE(threw);
}

void test_random_file_id_stays_in_range(void) {
  for (int i = 0; i < 1000; i++) {
    uint16_t id = FileSender::random_file_id();
    TEST_ASSERT_TRUE(id >= FILE_ID_MIN);
    TEST_ASSERT_TRUE(id <= FILE_ID_MAX);
  }
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_bulk_send_emits_every_chunk_then_end);
  RUN_TEST(test_ack_completes_transfer);
  RUN_TEST(test_empty_nack_completes_transfer);
  RUN_TEST(test_nack_retransmits_only_listed_chunks);
  RUN_TEST(test_nack_entries_beyond_total_are_skipped);
  RUN_TEST(test_feedback_for_other_transfers_is_ignored);
  RUN_TEST(test_malformed_feedback_is_dropped);
  RUN_TEST(test_round_cap_ends_in_failure);
  RUN_TEST(test_timeout_resends_end_then_unconfirmed_chunks);
  RUN_TEST(test_lost_round_resends_only_what_no_nack_confirmed);
  RUN_TEST(test_full_nack_confirms_nothing);
  RUN_TEST(test_silent_receiver_fails_after_round_cap);
  RUN_TEST(test_stop_flag_interrupts_send);
  RUN_TEST(test_transport_error_fails_and_propagates);
  RUN_TEST(test_file_too_large_is_rejected_before_sending);
  RUN_TEST(test_invalid_config_is_rejected);
  RUN_TEST(test_random_file_id_stays_in_range);
  return UNITY_END();
}
