#include <replsim/core/arrivals_queue.hpp>

namespace replsim::core {

void ArrivalsQueue::seed(double quantity, std::optional<Date> arrival_date) {
    if (quantity > 0.0 && arrival_date) {
        pending_.emplace(*arrival_date, quantity);
    }
}

void ArrivalsQueue::schedule(double quantity, Date arrival_date) {
    pending_.emplace(arrival_date, quantity);
}

std::vector<PendingArrival> ArrivalsQueue::mature_on(Date date) {
    std::vector<PendingArrival> matured;
    auto [first, last] = pending_.equal_range(date);
    for (auto it = first; it != last; ++it) {
        matured.push_back(PendingArrival{it->first, it->second});
    }
    pending_.erase(first, last);
    return matured;
}

bool ArrivalsQueue::has_pending_after(Date date) const {
    return pending_.upper_bound(date) != pending_.end();
}

double ArrivalsQueue::pending_quantity() const {
    double total = 0.0;
    for (const auto& [when, quantity] : pending_) {
        total += quantity;
    }
    return total;
}

} // namespace replsim::core
