#include "stt/transcription_error.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AudioOpen: return "AudioOpenError";
        case ErrorKind::AudioDecode: return "AudioDecodeError";
        case ErrorKind::ModelLoad: return "ModelLoadError";
        case ErrorKind::StateInit: return "StateInitError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::SegmentText: return "SegmentTextError";
        case ErrorKind::StoreUnavailable: return "StoreUnavailable";
        case ErrorKind::EventEmission: return "EventEmissionError";
        case ErrorKind::SessionBusy: return "SessionBusy";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "UnknownError";
}
