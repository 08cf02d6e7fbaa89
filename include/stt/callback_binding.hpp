#ifndef CALLBACK_BINDING_HPP
#define CALLBACK_BINDING_HPP

#include "stt/engine.hpp"

#include <cstddef>
#include <exception>

struct whisper_context;
struct whisper_state;

// Ties one decode run to its listener. Lives on the stack of the run for the
// whole decode; the engine only ever holds a borrowed pointer to it and the
// callbacks never release it.
//
// Exceptions thrown by the listener are stored instead of unwinding through
// the engine, and rethrown by rethrowIfFailed() once the engine returned.
class CallbackBinding {
public:
    CallbackBinding(const DecodeState& state, SegmentListener& listener);

    CallbackBinding(const CallbackBinding&) = delete;
    CallbackBinding& operator=(const CallbackBinding&) = delete;

    // Forwards one finalized segment. Does nothing once an error is stored.
    void deliver();

    bool failed() const { return static_cast<bool>(error_); }
    void rethrowIfFailed() const;

    std::size_t deliveries() const { return deliveries_; }

private:
    const DecodeState& state_;
    SegmentListener& listener_;
    std::exception_ptr error_;
    std::size_t deliveries_ = 0;
};

// whisper_new_segment_callback. user_data must be a CallbackBinding*; a null
// pointer breaks the ownership contract and terminates the process.
void segmentCallbackTrampoline(whisper_context* ctx, whisper_state* state, int n_new, void* user_data);

// ggml_abort_callback. Stops the decode after a listener failure.
bool abortOnCallbackError(void* user_data);

#endif
