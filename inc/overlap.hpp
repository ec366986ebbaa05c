#pragma once
#include <optional>
#include <vector>

#include "common.hpp"

namespace NReservation {

    // Back-to-back windows (a.End == b.Start) do not overlap.
    inline bool Overlaps(const TInterval& candidate, const TInterval& existing) {
        return candidate.Start < existing.End && existing.Start < candidate.End;
    }

    inline bool HasConflict(const TInterval& candidate, const std::vector<TInterval>& existing) {
        for (auto const& e : existing) {
            if (Overlaps(candidate, e)) {
                return true;
            }
        }
        return false;
    }

    // Ids of the reservations in `existing` whose window overlaps `candidate`.
    // `exclude` removes a reservation from consideration (the one being updated).
    inline std::vector<ReservationId> FindConflicts(const TInterval& candidate,
                                                    const std::vector<TReservation>& existing,
                                                    std::optional<ReservationId> exclude,
                                                    bool ignoreCancelled) {
        std::vector<ReservationId> out;
        for (auto const& r : existing) {
            if (exclude && r.Id == *exclude) {
                continue;
            }
            if (ignoreCancelled && r.Status == EReservationStatus::Cancelled) {
                continue;
            }
            if (Overlaps(candidate, r.Window())) {
                out.push_back(r.Id);
            }
        }
        return out;
    }

} // namespace NReservation
