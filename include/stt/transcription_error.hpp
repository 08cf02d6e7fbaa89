#ifndef TRANSCRIPTION_ERROR_HPP
#define TRANSCRIPTION_ERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    AudioOpen,
    AudioDecode,
    ModelLoad,
    StateInit,
    Decode,
    SegmentText,
    StoreUnavailable,
    EventEmission,
    SessionBusy,
    InvalidRequest
};

const char* errorKindName(ErrorKind kind);

class TranscriptionError : public std::runtime_error {
public:
    TranscriptionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

#endif
