#pragma once
#include <memory>
#include <optional>
#include <vector>

#include "ReservationQuery.hpp"
#include "ReservationStore.hpp"
#include "catalog.hpp"
#include "common.hpp"
#include "result.hpp"

namespace NReservation {

    enum class EStatusPolicy {
        // Any status may be written on create or update. Default.
        Open,
        // pending -> confirmed, pending -> cancelled, confirmed -> cancelled.
        // Cancelled and elapsed reservations are frozen.
        Strict
    };

    struct TEngineOptions {
        EStatusPolicy StatusPolicy = EStatusPolicy::Open;
        // When false a cancelled reservation still blocks its window.
        bool ExcludeCancelledFromConflicts = false;
        size_t DefaultPageLimit = DEFAULT_PAGE_LIMIT;
    };

    bool IsAllowedTransition(EReservationStatus from, EReservationStatus to);

    class TReservationEngine {
    public:
        TReservationEngine(std::shared_ptr<IReservationStore> store,
                           std::shared_ptr<const IResourceCatalog> resources,
                           std::shared_ptr<const IUserDirectory> users,
                           TEngineOptions options = {},
                           TClock clock = [] { return std::chrono::system_clock::now(); });

        TResult<TReservation> Create(const TReservationDraft& draft);
        TResult<TReservation> Update(ReservationId id, const TReservationPatch& patch);
        TResult<void> Remove(ReservationId id);

        TResult<TReservationView> Get(ReservationId id) const;
        TListPage List(const TListFilter& filter) const;
        std::vector<TReservationView> ListAll() const;
        size_t Count() const;

        const TEngineOptions& Options() const {
            return Options_;
        }

    private:
        std::optional<TError> CheckReferences(const TReservation& candidate) const;
        std::optional<TError> CheckEditable(const TReservation& current, const TReservation& merged) const;
        std::optional<TError> CheckAvailability(const TReservation& candidate, std::optional<ReservationId> self) const;

    private:
        std::shared_ptr<IReservationStore> Store;
        std::shared_ptr<const IResourceCatalog> Resources;
        std::shared_ptr<const IUserDirectory> Users;
        TReservationQuery Query;
        TEngineOptions Options_;
        TClock Clock;
    };

} // namespace NReservation
