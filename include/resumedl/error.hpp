#pragma once

#include <stdexcept>
#include <string>

namespace resumedl {

// Classification of everything that can end or interrupt a transfer.
// Observers only ever see one of these, rendered as status text.
enum class ErrorKind {
    InvalidSource,
    Cancelled,
    Resumable,
    Unrecoverable,
    StorageFinalizeFailure
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Thrown when the engine itself cannot operate (libcurl init, unusable state
// directory, failed store write). Transfer errors never use this path.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace resumedl
