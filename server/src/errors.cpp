/*
 * 설명: 업스트림 오류 분류와 사용자 노출 문구를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_broadcaster_test.cpp
 */
#include "livechat/errors.hpp"

namespace livechat {

const char* UpstreamCategoryName(UpstreamErrorCategory category) {
  switch (category) {
    case UpstreamErrorCategory::kAuthentication:
      return "authentication_error";
    case UpstreamErrorCategory::kRateLimit:
      return "rate_limit_error";
    case UpstreamErrorCategory::kService:
      return "service_error";
    case UpstreamErrorCategory::kNetwork:
      return "network_error";
    case UpstreamErrorCategory::kUnknown:
      break;
  }
  return "unknown_error";
}

UpstreamError::UpstreamError(UpstreamErrorCategory category, int status_code, const std::string& detail)
    : LiveChatError(detail, UpstreamCategoryName(category)), category_(category), status_code_(status_code) {}

UpstreamError UpstreamError::FromStatus(int status_code, const std::string& detail) {
  if (status_code == 401) {
    return UpstreamError(UpstreamErrorCategory::kAuthentication, status_code, detail);
  }
  if (status_code == 429) {
    return UpstreamError(UpstreamErrorCategory::kRateLimit, status_code, detail);
  }
  if (status_code >= 500) {
    return UpstreamError(UpstreamErrorCategory::kService, status_code, detail);
  }
  if (status_code == 0) {
    return UpstreamError(UpstreamErrorCategory::kNetwork, status_code, detail);
  }
  return UpstreamError(UpstreamErrorCategory::kUnknown, status_code, detail);
}

std::string UpstreamError::UserMessage() const {
  switch (category_) {
    case UpstreamErrorCategory::kAuthentication:
      return "Invalid API key";
    case UpstreamErrorCategory::kRateLimit:
      return "Rate limit exceeded. Please try again later.";
    case UpstreamErrorCategory::kService:
      return "Upstream service error. Please try again later.";
    case UpstreamErrorCategory::kNetwork:
      return "Network error while contacting the model service.";
    case UpstreamErrorCategory::kUnknown:
      break;
  }
  return "Failed to generate response";
}

}  // namespace livechat
