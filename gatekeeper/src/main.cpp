/*
 * 설명: 게이트키퍼 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "gatekeeper/app.hpp"

int main() {
  using namespace gatekeeper;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  try {
    GatekeeperApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
