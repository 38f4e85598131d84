#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Error Classification
// ═══════════════════════════════════════════════════════════════════════════
// Decides whether an error counts against the breaker. The engine only sees
// IErrorClassifier; applications plug in predicates or exception types.
//
//   Failure    - recorded, counts towards the failure rate
//   Ignored    - not recorded; an ignored-error event is still published
//   NotMatched - treated as a success
//
// Usage:
//   auto classifier = std::make_shared<ExceptionTypeClassifier>();
//   classifier->record<std::system_error>()
//              .ignore<std::invalid_argument>();
//   config.error_classifier = classifier;

#include "circuitry/core/call_outcome.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace circuitry {

enum class ErrorClass {
    Failure,
    Ignored,
    NotMatched
};

[[nodiscard]] constexpr std::string_view to_string(ErrorClass value) noexcept {
    switch (value) {
        case ErrorClass::Failure:    return "failure";
        case ErrorClass::Ignored:    return "ignored";
        case ErrorClass::NotMatched: return "not-matched";
    }
    return "unknown";
}

class IErrorClassifier {
public:
    virtual ~IErrorClassifier() = default;

    /// Called without any breaker lock held; must be thread-safe.
    [[nodiscard]] virtual ErrorClass classify(const ErrorInfo& error) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// RecordAllClassifier - every error is a failure (the default)
// ─────────────────────────────────────────────────────────────────────────────

class RecordAllClassifier final : public IErrorClassifier {
public:
    [[nodiscard]] ErrorClass classify(const ErrorInfo& /*error*/) const override {
        return ErrorClass::Failure;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// PredicateClassifier - arbitrary callables
// ─────────────────────────────────────────────────────────────────────────────
// The ignore predicate is consulted first. An empty record predicate records
// every error that is not ignored.

class PredicateClassifier final : public IErrorClassifier {
public:
    using Predicate = std::function<bool(const ErrorInfo&)>;

    PredicateClassifier(Predicate record, Predicate ignore)
        : record_(std::move(record))
        , ignore_(std::move(ignore))
    {}

    [[nodiscard]] ErrorClass classify(const ErrorInfo& error) const override;

    [[nodiscard]] const Predicate& record_predicate() const noexcept { return record_; }
    [[nodiscard]] const Predicate& ignore_predicate() const noexcept { return ignore_; }

private:
    Predicate record_;
    Predicate ignore_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExceptionTypeClassifier - match on the dynamic exception type
// ─────────────────────────────────────────────────────────────────────────────
// Matching rethrows the captured exception_ptr, so base classes match their
// derived types just like a catch clause would. Errors without an exception
// (ErrorInfo::make) never match an ignore entry and only match the record
// list when it is empty.

class ExceptionTypeClassifier final : public IErrorClassifier {
public:
    template <typename E>
    ExceptionTypeClassifier& record() {
        record_.push_back(&matches<E>);
        return *this;
    }

    template <typename E>
    ExceptionTypeClassifier& ignore() {
        ignore_.push_back(&matches<E>);
        return *this;
    }

    [[nodiscard]] ErrorClass classify(const ErrorInfo& error) const override;

    [[nodiscard]] std::size_t recorded_type_count() const noexcept { return record_.size(); }
    [[nodiscard]] std::size_t ignored_type_count() const noexcept { return ignore_.size(); }

private:
    using Matcher = bool (*)(const std::exception_ptr&);

    template <typename E>
    static bool matches(const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const E&) {
            return true;
        } catch (...) {
            return false;
        }
    }

    [[nodiscard]] static bool any_match(const std::vector<Matcher>& matchers,
                                        const std::exception_ptr& error);

    std::vector<Matcher> record_;
    std::vector<Matcher> ignore_;
};

/// Resolve a possibly-null classifier to the one actually used
[[nodiscard]] const IErrorClassifier& classifier_or_default(
    const std::shared_ptr<const IErrorClassifier>& classifier
) noexcept;

}  // namespace circuitry
