#pragma once

#include "scansync/core/cancellation.hpp"
#include "scansync/core/result.hpp"

#include <chrono>

namespace scansync {

/**
 * @brief Run step every interval until it reports completion
 *
 * step is invoked immediately and then once per interval. It returns
 * Result<bool>: true ends the poll successfully, false keeps polling and
 * an error ends the poll with that error. Cancellation is checked before
 * every step and interrupts the wait between steps.
 */
template<typename Step>
Result<void> poll_every(std::chrono::milliseconds interval,
                        const CancellationToken& token,
                        Step&& step) {
    while (true) {
        if (token.is_cancelled()) {
            return Err<void>(Error::cancelled());
        }

        Result<bool> outcome = step();
        if (outcome.is_error()) {
            return Err<void>(outcome.error());
        }
        if (outcome.value()) {
            return Ok();
        }

        if (token.wait_for(interval)) {
            return Err<void>(Error::cancelled());
        }
    }
}

} // namespace scansync
