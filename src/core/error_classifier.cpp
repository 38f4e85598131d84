#include "circuitry/core/error_classifier.hpp"

namespace circuitry {

ErrorClass PredicateClassifier::classify(const ErrorInfo& error) const {
    if (ignore_ && ignore_(error)) {
        return ErrorClass::Ignored;
    }
    if (!record_) {
        return ErrorClass::Failure;
    }
    return record_(error) ? ErrorClass::Failure : ErrorClass::NotMatched;
}

bool ExceptionTypeClassifier::any_match(const std::vector<Matcher>& matchers,
                                        const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    for (const auto matcher : matchers) {
        if (matcher(error)) {
            return true;
        }
    }
    return false;
}

ErrorClass ExceptionTypeClassifier::classify(const ErrorInfo& error) const {
    if (any_match(ignore_, error.exception)) {
        return ErrorClass::Ignored;
    }
    if (record_.empty()) {
        return ErrorClass::Failure;
    }
    return any_match(record_, error.exception) ? ErrorClass::Failure : ErrorClass::NotMatched;
}

const IErrorClassifier& classifier_or_default(
    const std::shared_ptr<const IErrorClassifier>& classifier
) noexcept {
    static const RecordAllClassifier record_all;
    if (classifier) {
        return *classifier;
    }
    return record_all;
}

}  // namespace circuitry
