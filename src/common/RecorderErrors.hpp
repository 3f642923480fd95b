#pragma once

#include <stdexcept>
#include <string>

class RecorderError : public std::runtime_error {
public:
    explicit RecorderError(const std::string& message)
        : std::runtime_error(message) {}
};

// The audio subsystem could not be queried for devices
class DeviceQueryError : public RecorderError {
public:
    explicit DeviceQueryError(const std::string& message)
        : RecorderError("Device query failed: " + message) {}
};

class UnsupportedFormatError : public RecorderError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : RecorderError("Unsupported format: " + message) {}
};

// The input device disappeared while a stream was open
class DeviceLostError : public RecorderError {
public:
    explicit DeviceLostError(const std::string& message)
        : RecorderError("Device lost: " + message) {}
};

// Testing and Recording are mutually exclusive
class SessionConflictError : public RecorderError {
public:
    explicit SessionConflictError(const std::string& message)
        : RecorderError("Session conflict: " + message) {}
};

class InvalidParameterError : public RecorderError {
public:
    explicit InvalidParameterError(const std::string& message)
        : RecorderError("Invalid parameter: " + message) {}
};

class WriteFailedError : public RecorderError {
public:
    explicit WriteFailedError(const std::string& message)
        : RecorderError("Write failed: " + message) {}
};
