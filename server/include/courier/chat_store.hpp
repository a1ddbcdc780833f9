/*
 * 설명: 메시지 이력/멤버십/읽음 커서를 보관하는 영속 저장소 인터페이스와 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/memory_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "courier/chat_types.hpp"

namespace courier {

class StoreException : public std::runtime_error {
 public:
  explicit StoreException(const std::string& message) : std::runtime_error(message) {}
};

// 모든 메서드는 저장소 장애 시 StoreException을 던진다. 재시도 정책은 구현체가 가진다.
class ChatStore {
 public:
  virtual ~ChatStore() = default;

  // 대화별 다음 시퀀스를 할당해 저장하고 그 값을 반환한다.
  virtual std::uint64_t AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                                      const MessagePayload& payload) = 0;
  // since_sequence보다 큰 메시지를 시퀀스 오름차순으로 최대 limit개 반환한다.
  virtual std::vector<StoredMessage> FetchHistory(const ConversationId& conversation_id,
                                                  std::uint64_t since_sequence, std::size_t limit) = 0;
  virtual std::optional<StoredMessage> FindMessage(const ConversationId& conversation_id,
                                                   std::uint64_t sequence) = 0;
  virtual MemberSet FetchMembership(const ConversationId& conversation_id) = 0;
  virtual std::vector<ConversationId> FetchConversationsFor(const UserId& user_id) = 0;
  // 읽음 커서는 뒤로 가지 않는다.
  virtual void UpdateReadCursor(const ConversationId& conversation_id, const UserId& user_id,
                                std::uint64_t sequence) = 0;
};

class MemoryChatStore : public ChatStore {
 public:
  std::uint64_t AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                              const MessagePayload& payload) override;
  std::vector<StoredMessage> FetchHistory(const ConversationId& conversation_id, std::uint64_t since_sequence,
                                          std::size_t limit) override;
  std::optional<StoredMessage> FindMessage(const ConversationId& conversation_id, std::uint64_t sequence) override;
  MemberSet FetchMembership(const ConversationId& conversation_id) override;
  std::vector<ConversationId> FetchConversationsFor(const UserId& user_id) override;
  void UpdateReadCursor(const ConversationId& conversation_id, const UserId& user_id,
                        std::uint64_t sequence) override;

  // 대화 관리 협력자 역할(테스트/로컬 실행용)
  void PutConversation(const ConversationId& conversation_id, const MemberSet& members);
  void AddMember(const ConversationId& conversation_id, const UserId& user_id);
  void RemoveMember(const ConversationId& conversation_id, const UserId& user_id);
  std::optional<std::uint64_t> ReadCursor(const ConversationId& conversation_id, const UserId& user_id) const;

  // {"conversations": {"<id>": ["<user>", ...]}} 형식의 JSON 파일을 읽는다.
  void LoadSeedFile(const std::string& path);

 private:
  struct Conversation {
    MemberSet members;
    std::vector<StoredMessage> messages;
    std::unordered_map<UserId, std::uint64_t> read_cursors;
  };

  mutable std::mutex mutex_;
  std::unordered_map<ConversationId, Conversation> conversations_;
};

}  // namespace courier
