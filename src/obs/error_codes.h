#pragma once

namespace sectorscan {
namespace obs {

inline constexpr const char* kErrConfigInvalid = "E_CONFIG_INVALID";
inline constexpr const char* kErrInputParseError = "E_INPUT_PARSE_ERROR";
inline constexpr const char* kErrOutputWriteFailed = "E_OUTPUT_WRITE_FAILED";

inline constexpr const char* kErrDbConnectFailed = "E_DB_CONNECT_FAILED";
inline constexpr const char* kErrDbQueryFailed = "E_DB_QUERY_FAILED";
inline constexpr const char* kErrDbInsertFailed = "E_DB_INSERT_FAILED";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace sectorscan
