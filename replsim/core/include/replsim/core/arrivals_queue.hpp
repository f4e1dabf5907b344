#pragma once

#include <replsim/core/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace replsim::core {

/// @brief A quantity that becomes available on a given date.
/// @ingroup core_queue
struct PendingArrival {
    Date arrival_date{}; ///< Day on which the quantity is credited.
    double quantity{0.0}; ///< Units credited on arrival.
};

/// @brief Pending inventory increments keyed by arrival date.
///
/// Holds the seeded in-transit arrival plus every order placed but not yet
/// received. Entries sharing a date mature in insertion order. Each entry is
/// matured at most once: mature_on() removes what it returns.
///
/// Owned by exactly one simulation run.
///
/// @see Simulator
/// @ingroup core_queue
class ArrivalsQueue {
public:
    /// @brief Insert the initial in-transit arrival.
    ///
    /// No-op unless @p quantity > 0 and @p arrival_date is provided.
    void seed(double quantity, std::optional<Date> arrival_date);

    /// @brief Insert the arrival resulting from a placed order.
    void schedule(double quantity, Date arrival_date);

    /// @brief Remove and return every entry arriving exactly on @p date.
    [[nodiscard]] std::vector<PendingArrival> mature_on(Date date);

    /// @brief True if any entry arrives strictly after @p date.
    [[nodiscard]] bool has_pending_after(Date date) const;

    /// @brief Sum of all pending quantities.
    [[nodiscard]] double pending_quantity() const;

    [[nodiscard]] std::size_t size() const noexcept { return pending_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pending_.empty(); }

    /// @brief Drop every pending entry.
    void clear() noexcept { pending_.clear(); }

private:
    // multimap keeps equal keys in insertion order
    std::multimap<Date, double> pending_;
};

} // namespace replsim::core
