#include <gtest/gtest.h>

#include <atomic>
#include <ctime>
#include <thread>
#include <vector>

#include "courier/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = courier::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = courier::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, DeliveredMessageFrame) {
  courier::OutboundEvent event;
  event.kind = courier::OutboundKind::kMessageDelivered;
  event.conversation_id = "c1";
  event.actor_id = "alice";
  event.sequence = 7;
  event.timestamp = std::chrono::system_clock::from_time_t(0);
  event.message = {"hi", ""};

  auto frame = courier::MakeEventFrame(event);
  EXPECT_EQ(frame["t"], "event");
  EXPECT_EQ(frame["event"], "message.delivered");
  EXPECT_EQ(frame["seq"], 7);
  EXPECT_EQ(frame["p"]["conversationId"], "c1");
  EXPECT_EQ(frame["p"]["actorId"], "alice");
  EXPECT_EQ(frame["p"]["sequence"], 7);
  EXPECT_EQ(frame["p"]["text"], "hi");
  EXPECT_TRUE(frame["p"]["attachmentRef"].is_null());
  EXPECT_EQ(frame["p"]["timestamp"], "1970-01-01T00:00:00Z");
}

TEST(JsonEnvelopeTest, PresenceFrameCarriesStatusWithoutConversation) {
  courier::OutboundEvent event;
  event.kind = courier::OutboundKind::kPresenceChanged;
  event.actor_id = "bob";
  event.presence = courier::PresenceStatus::kAway;

  auto frame = courier::MakeEventFrame(event);
  EXPECT_EQ(frame["event"], "presence.changed");
  EXPECT_EQ(frame["p"]["status"], "away");
  EXPECT_TRUE(frame["p"].contains("lastSeen"));
  EXPECT_FALSE(frame["p"].contains("conversationId"));
}

TEST(JsonEnvelopeTest, ReadFrameOmitsMessageBody) {
  courier::OutboundEvent event;
  event.kind = courier::OutboundKind::kMessageRead;
  event.conversation_id = "c1";
  event.actor_id = "bob";
  event.sequence = 3;

  auto frame = courier::MakeEventFrame(event);
  EXPECT_EQ(frame["event"], "message.read");
  EXPECT_EQ(frame["p"]["sequence"], 3);
  EXPECT_FALSE(frame["p"].contains("text"));
}

TEST(JsonEnvelopeTest, ReplyAndErrorFramesEchoRequestSeq) {
  auto reply = courier::MakeReplyFrame("message.accepted", {{"sequence", 4}}, 12);
  EXPECT_EQ(reply["t"], "event");
  EXPECT_EQ(reply["event"], "message.accepted");
  EXPECT_EQ(reply["seq"], 12);
  EXPECT_EQ(reply["p"]["sequence"], 4);

  auto error = courier::MakeErrorFrame(courier::errc::kNotAMember, "대화 참여자가 아닙니다", 5);
  EXPECT_EQ(error["t"], "error");
  EXPECT_TRUE(error["event"].is_null());
  EXPECT_EQ(error["seq"], 5);
  EXPECT_EQ(error["p"]["code"], "not_a_member");
}

TEST(JsonEnvelopeTest, StoredMessageJson) {
  courier::StoredMessage message{"c1", 2, "alice", {"", "blob://1"}, std::chrono::system_clock::from_time_t(60)};
  auto j = courier::ToJson(message);
  EXPECT_EQ(j["sequence"], 2);
  EXPECT_EQ(j["senderId"], "alice");
  EXPECT_EQ(j["attachmentRef"], "blob://1");
  EXPECT_EQ(j["createdAt"], "1970-01-01T00:01:00Z");
}

TEST(JsonEnvelopeTest, TimestampsFormatIndependentlyAcrossThreads) {
  // 스레드마다 다른 날짜를 반복 변환해도 서로의 결과가 섞이지 않아야 한다.
  const std::vector<std::pair<std::time_t, std::string>> cases{
      {0, "1970-01-01T00:00:00Z"},
      {86400 * 365, "1971-01-01T00:00:00Z"},
      {951782400, "2000-02-29T00:00:00Z"},
      {1700000000, "2023-11-14T22:13:20Z"}};
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (const auto& [epoch, expected] : cases) {
    threads.emplace_back([&mismatches, epoch = epoch, expected = expected] {
      for (int i = 0; i < 2000; ++i) {
        if (courier::ToIsoString(std::chrono::system_clock::from_time_t(epoch)) != expected) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
