/**
 * @file Warning.cpp
 * @brief Warning rendering and the process-wide observer slot
 */

#include "unbox/Warning.hpp"

namespace unbox {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<WarningObserver> g_observer;

} // anonymous namespace

std::string Warning::describe() const {
    switch (kind_) {
        case Kind::InvalidElement:
            return "Skipped invalid collection element: " + error_.describe();
        case Kind::InvalidOptionalValue:
            return "Ignored invalid optional value: " + error_.describe();
    }
    return error_.describe();
}

void StreamWarningLogger::on_warning(const Warning& warning) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Warning: " << warning.describe() << "\n";
}

void set_warning_observer(std::shared_ptr<WarningObserver> observer) {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    g_observer = std::move(observer);
}

std::shared_ptr<WarningObserver> warning_observer() {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    return g_observer;
}

} // namespace unbox
