#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
}  // namespace GENERAL

namespace DEVICE {  // Device session errors

constexpr int NO_DEVICE = 6000;  // No device attached
constexpr int IDENTITY_MISMATCH = 6001;  // Connected device is not the expected model/firmware
constexpr int SUBSCRIPTION_FAILED = 6002;  // Presence event subscription failed
constexpr int SERVICE_START_FAILED = 6003;  // Device service could not be started
constexpr int UNSUPPORTED_HANDLE = 6004;  // Handle does not belong to this backend
}  // namespace DEVICE

namespace INSTALL {  // Installer errors

constexpr int START_FAILED = 7000;  // Installer failed to begin
constexpr int UPLOAD_FAILED = 7001;  // Bundle upload to the device failed
constexpr int REPORTED_ERROR = 7002;  // Installer reported an error status
constexpr int NO_COMPLETION = 7003;  // Installer returned without a completion marker
}  // namespace INSTALL

namespace LOGSTREAM {  // Log stream errors

constexpr int FILTER_CONSTRUCTION = 8000;  // Invalid filter pattern
constexpr int CAPTURE_FAILED = 8001;  // Device log capture could not start
constexpr int RACE_ALREADY_ARMED = 8002;  // Completion race armed twice
}  // namespace LOGSTREAM

}  // namespace my_errors
