#include "stt/callback_binding.hpp"

#include <iostream>

// Constructor
CallbackBinding::CallbackBinding(const DecodeState& state, SegmentListener& listener)
    : state_(state), listener_(listener) {}

void CallbackBinding::deliver() {
    if (error_) return;

    ++deliveries_;
    try {
        listener_.onNewSegment(state_);
    } catch (...) {
        error_ = std::current_exception();
    }
}

void CallbackBinding::rethrowIfFailed() const {
    if (error_) std::rethrow_exception(error_);
}

void segmentCallbackTrampoline(whisper_context*, whisper_state*, int, void* user_data) {
    auto* binding = static_cast<CallbackBinding*>(user_data);
    if (!binding) {
        std::cerr << "[Whisper] [FATAL] segment callback fired without its run binding" << std::endl;
        std::terminate();
    }
    binding->deliver();
}

bool abortOnCallbackError(void* user_data) {
    const auto* binding = static_cast<const CallbackBinding*>(user_data);
    return binding && binding->failed();
}
