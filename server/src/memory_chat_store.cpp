/*
 * 설명: 프로세스 메모리에 메시지/멤버십/읽음 커서를 보관하는 저장소 구현.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/memory_store_test.cpp
 */
#include "courier/chat_store.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace courier {

std::uint64_t MemoryChatStore::AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                                             const MessagePayload& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& conversation = conversations_[conversation_id];
  StoredMessage message;
  message.conversation_id = conversation_id;
  message.sequence = conversation.messages.size() + 1;
  message.sender_id = sender_id;
  message.payload = payload;
  message.created_at = std::chrono::system_clock::now();
  conversation.messages.push_back(message);
  return message.sequence;
}

std::vector<StoredMessage> MemoryChatStore::FetchHistory(const ConversationId& conversation_id,
                                                         std::uint64_t since_sequence, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StoredMessage> result;
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end()) {
    return result;
  }
  const auto& messages = it->second.messages;
  // 시퀀스는 1부터 빈틈없이 증가하므로 인덱스로 바로 접근한다.
  for (std::size_t i = static_cast<std::size_t>(std::min<std::uint64_t>(since_sequence, messages.size()));
       i < messages.size() && result.size() < limit; ++i) {
    result.push_back(messages[i]);
  }
  return result;
}

std::optional<StoredMessage> MemoryChatStore::FindMessage(const ConversationId& conversation_id,
                                                          std::uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end() || sequence == 0 || sequence > it->second.messages.size()) {
    return std::nullopt;
  }
  return it->second.messages[sequence - 1];
}

MemberSet MemoryChatStore::FetchMembership(const ConversationId& conversation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end()) {
    return {};
  }
  return it->second.members;
}

std::vector<ConversationId> MemoryChatStore::FetchConversationsFor(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConversationId> result;
  for (const auto& [id, conversation] : conversations_) {
    if (conversation.members.count(user_id) > 0) {
      result.push_back(id);
    }
  }
  return result;
}

void MemoryChatStore::UpdateReadCursor(const ConversationId& conversation_id, const UserId& user_id,
                                       std::uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& cursor = conversations_[conversation_id].read_cursors[user_id];
  cursor = std::max(cursor, sequence);
}

void MemoryChatStore::PutConversation(const ConversationId& conversation_id, const MemberSet& members) {
  std::lock_guard<std::mutex> lock(mutex_);
  conversations_[conversation_id].members = members;
}

void MemoryChatStore::AddMember(const ConversationId& conversation_id, const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  conversations_[conversation_id].members.insert(user_id);
}

void MemoryChatStore::RemoveMember(const ConversationId& conversation_id, const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conversations_.find(conversation_id);
  if (it != conversations_.end()) {
    it->second.members.erase(user_id);
  }
}

std::optional<std::uint64_t> MemoryChatStore::ReadCursor(const ConversationId& conversation_id,
                                                         const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end()) {
    return std::nullopt;
  }
  auto cursor_it = it->second.read_cursors.find(user_id);
  if (cursor_it == it->second.read_cursors.end()) {
    return std::nullopt;
  }
  return cursor_it->second;
}

void MemoryChatStore::LoadSeedFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw StoreException("시드 파일을 열 수 없습니다: " + path);
  }
  nlohmann::json seed;
  try {
    seed = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    throw StoreException(std::string("시드 파일 파싱 실패: ") + ex.what());
  }
  auto conversations_it = seed.find("conversations");
  if (conversations_it == seed.end() || !conversations_it->is_object()) {
    throw StoreException("시드 파일에 conversations 객체가 없습니다");
  }
  for (const auto& [id, members_json] : conversations_it->items()) {
    if (!members_json.is_array()) {
      throw StoreException("멤버 목록은 배열이어야 합니다: " + id);
    }
    MemberSet members;
    for (const auto& member : members_json) {
      if (!member.is_string()) {
        throw StoreException("멤버 ID는 문자열이어야 합니다: " + id);
      }
      members.insert(member.get<std::string>());
    }
    PutConversation(id, members);
  }
}

}  // namespace courier
