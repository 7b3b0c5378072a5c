#pragma once

#include <stdexcept>
#include <string>

namespace thumbgrid {

// Base class for failures that end a single job.
class GridError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Usable duration after trimming the intro/outro margins is not positive.
class VideoTooShortError : public GridError {
public:
    explicit VideoTooShortError(double duration_seconds);

    double duration() const { return duration_; }

private:
    double duration_;
};

// The video asset could not be opened or could not produce a frame.
class DecodeError : public GridError {
public:
    using GridError::GridError;
};

// Raised inside FrameCache only; lookups translate it into a miss.
class CacheCorruptError : public GridError {
public:
    using GridError::GridError;
};

class CompositionError : public GridError {
public:
    using GridError::GridError;
};

class OutputWriteError : public CompositionError {
public:
    using CompositionError::CompositionError;
};

// Thrown at a checkpoint once cancellation has been requested. Not a
// GridError: a cancelled job ends in its own terminal state.
class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("Cancelled") {}
};

} // namespace thumbgrid
