/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "courier/app.hpp"

int main() {
  using namespace courier;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  try {
    ServerApp app(config);
    app.Run();
  } catch (const StoreException& ex) {
    std::cerr << "저장소 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
