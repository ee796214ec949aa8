#pragma once

#include <string>
#include <utility>
#include <variant>

#include <lunafmt/core/types.h>

namespace lunafmt::run {

/**
 * Terminal result of one formatting job. Every dispatched job produces exactly one.
 */
class JobOutcome {
public:
    // Written back, streamed, or no difference found
    struct Completed {};
    // Check mode found a difference; carries the rendered diff
    struct DiffAvailable {
        std::string diff;
    };
    struct Failed {
        Error error;
    };

    static JobOutcome completed() { return JobOutcome(Completed{}); }
    static JobOutcome diffAvailable(std::string diff) {
        return JobOutcome(DiffAvailable{std::move(diff)});
    }
    static JobOutcome failed(Error error) { return JobOutcome(Failed{std::move(error)}); }

    bool isCompleted() const { return std::holds_alternative<Completed>(state_); }
    bool isDiff() const { return std::holds_alternative<DiffAvailable>(state_); }
    bool isFailed() const { return std::holds_alternative<Failed>(state_); }

    const std::string& diff() const { return std::get<DiffAvailable>(state_).diff; }
    const Error& error() const { return std::get<Failed>(state_).error; }

    template <typename Visitor> decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), state_);
    }

private:
    using State = std::variant<Completed, DiffAvailable, Failed>;

    explicit JobOutcome(State state) : state_(std::move(state)) {}

    State state_;
};

} // namespace lunafmt::run
