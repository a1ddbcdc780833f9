/*
 * 설명: MariaDB에 대화 메시지/시퀀스/멤버십/읽음 커서를 저장하는 ChatStore 구현.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <mariadb/mysql.h>

#include "courier/chat_store.hpp"
#include "courier/db_client.hpp"

namespace courier {

class MariaDbChatStore : public ChatStore {
 public:
  explicit MariaDbChatStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema();

  std::uint64_t AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                              const MessagePayload& payload) override;
  std::vector<StoredMessage> FetchHistory(const ConversationId& conversation_id, std::uint64_t since_sequence,
                                          std::size_t limit) override;
  std::optional<StoredMessage> FindMessage(const ConversationId& conversation_id, std::uint64_t sequence) override;
  MemberSet FetchMembership(const ConversationId& conversation_id) override;
  std::vector<ConversationId> FetchConversationsFor(const UserId& user_id) override;
  void UpdateReadCursor(const ConversationId& conversation_id, const UserId& user_id,
                        std::uint64_t sequence) override;

  // 테스트 전용 정리
  void ClearAll() const;

 private:
  StoredMessage BuildMessage(MYSQL_ROW row) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace courier
