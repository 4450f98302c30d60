#pragma once
#include <stdexcept>
#include <string>

class SdmError : public std::runtime_error {
public:
    explicit SdmError(const std::string& what) : std::runtime_error(what) {}
};

// auth / handshake / transport setup
class ConnectionError : public SdmError {
public:
    explicit ConnectionError(const std::string& what) : SdmError(what) {}
};

// stat, chunk read, dead connection
class TransferError : public SdmError {
public:
    explicit TransferError(const std::string& what) : SdmError(what) {}
};

// local size differs from remote size after the stream ended
class VerificationError : public SdmError {
public:
    explicit VerificationError(const std::string& what) : SdmError(what) {}
};

// record update or distribution copy failed after a good download
class RecordingError : public SdmError {
public:
    explicit RecordingError(const std::string& what) : SdmError(what) {}
};

class CancelledError : public SdmError {
public:
    explicit CancelledError(const std::string& what) : SdmError(what) {}
};
