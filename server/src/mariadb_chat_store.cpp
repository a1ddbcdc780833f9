/*
 * 설명: 대화 메시지와 시퀀스 카운터, 멤버십, 읽음 커서를 MariaDB에 저장/조회한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "courier/mariadb_chat_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace courier {
namespace {
std::uint64_t ToUint64(const char* value) { return value ? std::stoull(value) : 0; }

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS conversation_members ("
    " conversation_id VARCHAR(64) NOT NULL, user_id VARCHAR(64) NOT NULL,"
    " PRIMARY KEY (conversation_id, user_id), KEY idx_member_user (user_id)) ENGINE=InnoDB;",
    "CREATE TABLE IF NOT EXISTS conversation_sequences ("
    " conversation_id VARCHAR(64) NOT NULL PRIMARY KEY,"
    " last_sequence BIGINT UNSIGNED NOT NULL) ENGINE=InnoDB;",
    "CREATE TABLE IF NOT EXISTS messages ("
    " conversation_id VARCHAR(64) NOT NULL, sequence BIGINT UNSIGNED NOT NULL,"
    " sender_id VARCHAR(64) NOT NULL, body TEXT NOT NULL, attachment_ref VARCHAR(512) NULL,"
    " created_at DATETIME(6) NOT NULL, PRIMARY KEY (conversation_id, sequence)) ENGINE=InnoDB;",
    "CREATE TABLE IF NOT EXISTS read_cursors ("
    " conversation_id VARCHAR(64) NOT NULL, user_id VARCHAR(64) NOT NULL,"
    " last_read_sequence BIGINT UNSIGNED NOT NULL, updated_at DATETIME(6) NOT NULL,"
    " PRIMARY KEY (conversation_id, user_id)) ENGINE=InnoDB;",
};

constexpr const char* kMessageColumns =
    "SELECT conversation_id, sequence, sender_id, body, attachment_ref, created_at FROM messages";
}  // namespace

MariaDbChatStore::MariaDbChatStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbChatStore::EnsureSchema() {
  db_client_->WithSession([](DbSession& session) {
    for (const char* sql : kSchema) {
      session.Execute(sql, "스키마 생성 실패");
    }
  });
}

std::uint64_t MariaDbChatStore::AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                                              const MessagePayload& payload) {
  std::uint64_t sequence = 0;
  auto created_at = std::chrono::system_clock::now();
  db_client_->InTransaction([&](DbSession& session) {
    std::string quoted_id = session.Quote(conversation_id);
    // 카운터 행의 갱신 잠금이 같은 대화의 동시 append를 직렬화한다.
    session.Execute("INSERT INTO conversation_sequences(conversation_id, last_sequence) VALUES(" + quoted_id +
                        ", 1) ON DUPLICATE KEY UPDATE last_sequence = last_sequence + 1;",
                    "시퀀스 증가 실패");
    auto issued = session.QueryUint64(
        "SELECT last_sequence FROM conversation_sequences WHERE conversation_id=" + quoted_id + ";", "시퀀스 조회 실패");
    if (!issued || *issued == 0) {
      throw DbException("시퀀스 행이 누락되었습니다", 0, false);
    }
    sequence = *issued;

    std::ostringstream insert;
    insert << "INSERT INTO messages(conversation_id, sequence, sender_id, body, attachment_ref, created_at) VALUES("
           << quoted_id << ", " << sequence << ", " << session.Quote(sender_id) << ", " << session.Quote(payload.text)
           << ", " << session.QuoteOrNull(payload.attachment_ref) << ", '" << ToTimestamp(created_at) << "');";
    session.Execute(insert.str(), "메시지 저장 실패");
  });
  return sequence;
}

std::vector<StoredMessage> MariaDbChatStore::FetchHistory(const ConversationId& conversation_id,
                                                          std::uint64_t since_sequence, std::size_t limit) {
  std::vector<StoredMessage> result;
  db_client_->WithSession([&](DbSession& session) {
    result.clear();
    std::ostringstream oss;
    oss << kMessageColumns << " WHERE conversation_id=" << session.Quote(conversation_id) << " AND sequence > "
        << since_sequence << " ORDER BY sequence ASC LIMIT " << limit << ";";
    session.ForEachRow(oss.str(), "이력 조회 실패", [&](MYSQL_ROW row) { result.push_back(BuildMessage(row)); });
  });
  return result;
}

std::optional<StoredMessage> MariaDbChatStore::FindMessage(const ConversationId& conversation_id,
                                                           std::uint64_t sequence) {
  std::optional<StoredMessage> result;
  db_client_->WithSession([&](DbSession& session) {
    std::ostringstream oss;
    oss << kMessageColumns << " WHERE conversation_id=" << session.Quote(conversation_id)
        << " AND sequence = " << sequence << ";";
    session.ForEachRow(oss.str(), "메시지 조회 실패", [&](MYSQL_ROW row) { result = BuildMessage(row); });
  });
  return result;
}

MemberSet MariaDbChatStore::FetchMembership(const ConversationId& conversation_id) {
  MemberSet members;
  db_client_->WithSession([&](DbSession& session) {
    members.clear();
    session.ForEachRow(
        "SELECT user_id FROM conversation_members WHERE conversation_id=" + session.Quote(conversation_id) + ";",
        "멤버십 조회 실패", [&](MYSQL_ROW row) {
          if (row[0]) {
            members.insert(row[0]);
          }
        });
  });
  return members;
}

std::vector<ConversationId> MariaDbChatStore::FetchConversationsFor(const UserId& user_id) {
  std::vector<ConversationId> conversations;
  db_client_->WithSession([&](DbSession& session) {
    conversations.clear();
    session.ForEachRow("SELECT conversation_id FROM conversation_members WHERE user_id=" + session.Quote(user_id) + ";",
                       "참여 대화 조회 실패", [&](MYSQL_ROW row) {
                         if (row[0]) {
                           conversations.emplace_back(row[0]);
                         }
                       });
  });
  return conversations;
}

void MariaDbChatStore::UpdateReadCursor(const ConversationId& conversation_id, const UserId& user_id,
                                        std::uint64_t sequence) {
  db_client_->InTransaction([&](DbSession& session) {
    std::ostringstream oss;
    oss << "INSERT INTO read_cursors(conversation_id, user_id, last_read_sequence, updated_at) VALUES("
        << session.Quote(conversation_id) << ", " << session.Quote(user_id) << ", " << sequence
        << ", NOW(6)) ON DUPLICATE KEY UPDATE"
        << " last_read_sequence = GREATEST(last_read_sequence, VALUES(last_read_sequence)), updated_at = NOW(6);";
    session.Execute(oss.str(), "읽음 커서 저장 실패");
  });
}

void MariaDbChatStore::ClearAll() const {
  db_client_->WithSession([](DbSession& session) {
    for (const char* sql : {"DELETE FROM read_cursors;", "DELETE FROM messages;", "DELETE FROM conversation_sequences;",
                            "DELETE FROM conversation_members;"}) {
      session.Execute(sql, "정리 실패");
    }
  });
}

StoredMessage MariaDbChatStore::BuildMessage(MYSQL_ROW row) const {
  StoredMessage message;
  message.conversation_id = row[0] ? row[0] : "";
  message.sequence = ToUint64(row[1]);
  message.sender_id = row[2] ? row[2] : "";
  message.payload.text = row[3] ? row[3] : "";
  message.payload.attachment_ref = row[4] ? row[4] : "";
  message.created_at = ParseTimestamp(row[5] ? row[5] : "1970-01-01 00:00:00");
  return message;
}

std::string MariaDbChatStore::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  // 여러 워커 스레드에서 호출되므로 재진입 가능한 변환을 쓴다.
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace courier
