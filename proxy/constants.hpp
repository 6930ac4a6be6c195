#pragma once

namespace convgate::proxy {

inline constexpr const char* kConversationPath = "/backend-api/conversation";
inline constexpr const char* kDashboardApiKeysPath = "/dashboard/user/api_keys";
inline constexpr const char* kSentinelPath     = "/backend-api/sentinel/chat-requirements";
inline constexpr const char* kModelsPath       = "/backend-api/models?history_and_training_disabled=false";

inline constexpr const char* kSessionCookieName = "_puid";
inline constexpr const char* kSentinelHeader    = "openai-sentinel-chat-requirements-token";
inline constexpr const char* kArkoseHeader      = "openai-sentinel-arkose-token";

inline constexpr const char* kModelField  = "model";
inline constexpr const char* kArkoseField = "arkose_token";
inline constexpr const char* kNullLiteral = "null";

inline constexpr const char* kDefaultOrigin    = "https://chat.openai.com";
inline constexpr const char* kDefaultApiOrigin = "https://chat.openai.com";

} // namespace convgate::proxy
