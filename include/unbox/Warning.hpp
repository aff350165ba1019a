/**
 * @file Warning.hpp
 * @brief Non-fatal decode diagnostics
 *
 * Warnings report recoverable anomalies: an invalid collection element that
 * was dropped, or an optional field that was present but malformed. They
 * never change whether a decode succeeds.
 *
 * Delivery:
 * - DecodeOptions::observer, when set, receives the warnings of that decode
 * - otherwise the process-wide observer (set_warning_observer), if any
 * - otherwise warnings are discarded
 */

#ifndef UNBOX_WARNING_HPP
#define UNBOX_WARNING_HPP

#include "Errors.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace unbox {

class Warning {
public:
    enum class Kind {
        InvalidElement,
        InvalidOptionalValue
    };

    /// An element of a collection failed and was dropped.
    static Warning invalid_element(DecodeError error) {
        return Warning(Kind::InvalidElement, std::move(error));
    }

    /// An optional field was present but could not be decoded.
    static Warning invalid_optional_value(DecodeError error) {
        return Warning(Kind::InvalidOptionalValue, std::move(error));
    }

    Kind kind() const noexcept { return kind_; }
    const DecodeError& error() const noexcept { return error_; }

    /**
     * @brief Render a one-line description
     * @return e.g. `Ignored invalid optional value: An error occurred ...`
     */
    std::string describe() const;

private:
    Warning(Kind kind, DecodeError error)
        : kind_(kind)
        , error_(std::move(error))
    {}

    Kind kind_;
    DecodeError error_;
};

/**
 * @brief Receiver of decode warnings
 *
 * Implementations must be safe to call from every thread that decodes.
 */
class WarningObserver {
public:
    virtual ~WarningObserver() = default;
    virtual void on_warning(const Warning& warning) = 0;
};

/**
 * @brief Observer that writes one line per warning to a stream
 */
class StreamWarningLogger : public WarningObserver {
public:
    explicit StreamWarningLogger(std::ostream& out = std::cerr) : out_(out) {}

    void on_warning(const Warning& warning) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

/// Callback form of an observer, as handed to the collection strategy.
using WarningSink = std::function<void(const Warning&)>;

/**
 * @brief Install (or clear, with nullptr) the process-wide observer
 *
 * Safe to call while other threads decode; decodes already running keep
 * the observer they started with.
 */
void set_warning_observer(std::shared_ptr<WarningObserver> observer);

/**
 * @brief Currently installed process-wide observer (may be nullptr)
 */
std::shared_ptr<WarningObserver> warning_observer();

} // namespace unbox

#endif // UNBOX_WARNING_HPP
