#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// ErrorInfo - what went wrong in a protected call
// ─────────────────────────────────────────────────────────────────────────────

struct ErrorInfo {
    std::string type;             ///< Demangled exception type, or a caller-chosen tag
    std::string message;
    std::exception_ptr exception; ///< Null when built with make()

    /// Capture a live exception (typically std::current_exception())
    [[nodiscard]] static ErrorInfo from_exception(std::exception_ptr error);

    /// Describe an error that was never thrown (status codes, error values)
    [[nodiscard]] static ErrorInfo make(std::string type, std::string message) {
        return {std::move(type), std::move(message), nullptr};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// CallOutcome - one finished call, as reported by the caller
// ─────────────────────────────────────────────────────────────────────────────

struct CallOutcome {
    bool succeeded{true};
    std::chrono::nanoseconds elapsed{0};
    std::optional<ErrorInfo> error;

    [[nodiscard]] static CallOutcome success(std::chrono::nanoseconds elapsed) {
        return {true, elapsed, std::nullopt};
    }

    [[nodiscard]] static CallOutcome failure(std::chrono::nanoseconds elapsed, ErrorInfo error) {
        return {false, elapsed, std::move(error)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ClassifiedCall - outcome after the error classifier and slow check ran
// ─────────────────────────────────────────────────────────────────────────────

enum class CallKind {
    Success,
    Failure,
    Ignored
};

struct ClassifiedCall {
    CallKind kind{CallKind::Success};
    bool slow{false};

    [[nodiscard]] bool is_failure() const noexcept { return kind == CallKind::Failure; }
    [[nodiscard]] bool is_ignored() const noexcept { return kind == CallKind::Ignored; }
};

}  // namespace circuitry
