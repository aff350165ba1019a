/**
 * @file Unboxer.cpp
 * @brief Non-template parts of the decode session
 */

#include "unbox/Unboxer.hpp"

namespace unbox {

// ============================================================================
// FailureLedger
// ============================================================================

void FailureLedger::record(const DecodeError& error) {
    if (error.kind() == DecodeError::Kind::Aggregated) {
        errors_.insert(errors_.end(), error.errors().begin(), error.errors().end());
        return;
    }
    errors_.push_back(error);
}

void FailureLedger::throw_if_failed() const {
    if (errors_.empty()) {
        return;
    }
    throw DecodeError::aggregated(errors_);
}

// ============================================================================
// Unboxer
// ============================================================================

Unboxer::Unboxer(const Value& tree, FailureLedger& ledger,
                 DecodeOptions options, std::any context)
    : tree_(tree)
    , ledger_(ledger)
    , options_(std::move(options))
    , context_(std::move(context))
{}

std::vector<std::string> Unboxer::all_keys() const {
    std::vector<std::string> keys;
    if (!tree_.is_object()) {
        return keys;
    }
    keys.reserve(tree_.size());
    for (auto it = tree_.begin(); it != tree_.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

bool Unboxer::contains(const Path& path) const {
    return contains_path(tree_, path);
}

void Unboxer::fail(const std::string& key) {
    report(DecodeError(PathError::missing_key(key), key));
}

void Unboxer::fail_for_invalid_value(const Value& value, const std::string& key,
                                     const std::string& expected_type) {
    report(DecodeError(PathError::invalid_value(value, key, expected_type), key));
}

void Unboxer::report(const DecodeError& error) {
    if (options_.mode == DecodeMode::Throwing) {
        throw error;
    }
    ledger_.record(error);
}

WarningSink Unboxer::warning_sink() const {
    if (!options_.emit_warnings) {
        return {};
    }
    std::shared_ptr<WarningObserver> observer =
        options_.observer ? options_.observer : warning_observer();
    if (!observer) {
        return {};
    }
    return [observer](const Warning& warning) { observer->on_warning(warning); };
}

void Unboxer::warn(const Warning& warning) const {
    if (auto sink = warning_sink()) {
        sink(warning);
    }
}

} // namespace unbox
