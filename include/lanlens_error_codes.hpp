#pragma once

namespace lanlens_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_PARAM = 5004;  // Missing parameter
constexpr int NOT_IMPLEMENTED = 5010;  // Not implemented
constexpr int RATE_LIMITED = 5013;  // Rate limit exceeded
constexpr int UNAUTHORIZED = 5018;  // Unauthorized
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int PERMISSION_DENIED = 5023;  // Permission denied
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_ERROR = 5204;  // SSL error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int RESOLVE_ERROR = 5206;  // Name resolution error
constexpr int BAD_URL = 5207;  // URL could not be parsed
constexpr int HTTP_STATUS = 5208;  // Unexpected HTTP status
constexpr int SOCKET_ERROR = 5209;  // Socket setup error
}  // namespace NETWORK

namespace FINGERPRINT {  // Fingerprint lookup errors

constexpr int INVALID_API_KEY = 6000;  // Remote service rejected the API key
constexpr int RATE_LIMITED = 6001;  // Remote service is rate limiting us
constexpr int SERVER_ERROR = 6002;  // Remote service returned 5xx
constexpr int NO_API_KEY = 6003;  // No API key configured
constexpr int DISABLED = 6004;  // Remote lookups disabled for the session
constexpr int NOT_FOUND = 6005;  // No fingerprint could be resolved
constexpr int XML_PARSE_ERROR = 6006;  // UPnP description is not valid XML
}  // namespace FINGERPRINT

namespace STORAGE {  // Persistence errors

constexpr int UNAVAILABLE = 7000;  // Database could not be opened
constexpr int QUERY_FAILED = 7001;  // Statement failed
constexpr int TRANSACTION_FAILED = 7002;  // Transaction failed
constexpr int CORRUPT_ENTRY = 7003;  // Stored row could not be decoded
}  // namespace STORAGE

namespace EXPORT {  // Export errors

constexpr int NO_DEVICES = 8000;  // Nothing to export
constexpr int UNSUPPORTED_FORMAT = 8001;  // Unknown export format
constexpr int WRITE_FAILED = 8002;  // Export file could not be written
}  // namespace EXPORT

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int DECODE_ERROR = 9001;  // Failed to decode/parse JSON (low-level)
constexpr int ENCODE_ERROR = 9002;  // Failed to encode/serialize JSON
constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
constexpr int MISSING_JSON_FIELD = 9004;  // Required JSON field missing
}  // namespace JSON

}  // namespace lanlens_errors
