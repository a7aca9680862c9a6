#pragma once

#include <stdexcept>
#include <string>

namespace bgs {
    // camera unavailable or stalled, terminates the capture process
    struct AcquisitionError : std::runtime_error {
        explicit AcquisitionError(const std::string& what) : std::runtime_error(what) {}
    };

    // one frame could not be processed, the stream goes on
    struct InferenceError : std::runtime_error {
        explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
    };

    // inference backend permanently unavailable, terminates the processing process
    struct ResourceExhausted : std::runtime_error {
        explicit ResourceExhausted(const std::string& what) : std::runtime_error(what) {}
    };

    struct WriteError : std::runtime_error {
        explicit WriteError(const std::string& what) : std::runtime_error(what) {}
    };

    struct WireFormatError : std::runtime_error {
        explicit WireFormatError(const std::string& what) : std::runtime_error(what) {}
    };
}
