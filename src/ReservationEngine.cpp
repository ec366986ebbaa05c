#include <ReservationEngine.hpp>
#include <overlap.hpp>
#include <log.hpp>

namespace NReservation {

    namespace {

        TReservation Merge(TReservation current, const TReservationPatch& patch) {
            if (patch.ResourceIdInternal) {
                current.ResourceIdInternal = *patch.ResourceIdInternal;
            }
            if (patch.UserIdInternal) {
                current.UserIdInternal = *patch.UserIdInternal;
            }
            if (patch.StartTime) {
                current.StartTime = *patch.StartTime;
            }
            if (patch.EndTime) {
                current.EndTime = *patch.EndTime;
            }
            if (patch.Status) {
                current.Status = *patch.Status;
            }
            return current;
        }

        std::string JoinIds(const std::vector<ReservationId>& ids) {
            std::string out;
            for (auto id : ids) {
                if (!out.empty()) {
                    out += ", ";
                }
                out += std::to_string(id);
            }
            return out;
        }

    } // namespace

    bool IsAllowedTransition(EReservationStatus from, EReservationStatus to) {
        if (from == to) {
            return true;
        }
        switch (from) {
            case EReservationStatus::Pending:
                return to == EReservationStatus::Confirmed || to == EReservationStatus::Cancelled;
            case EReservationStatus::Confirmed:
                return to == EReservationStatus::Cancelled;
            case EReservationStatus::Cancelled:
                return false;
        }
        return false;
    }

    TReservationEngine::TReservationEngine(std::shared_ptr<IReservationStore> store,
                                           std::shared_ptr<const IResourceCatalog> resources,
                                           std::shared_ptr<const IUserDirectory> users,
                                           TEngineOptions options,
                                           TClock clock)
        : Store(store)
        , Resources(resources)
        , Users(users)
        , Query(store, std::move(resources), std::move(users), options.DefaultPageLimit)
        , Options_(options)
        , Clock(std::move(clock)) {
    }

    std::optional<TError> TReservationEngine::CheckReferences(const TReservation& candidate) const {
        if (Resources && !Resources->FindResource(candidate.ResourceIdInternal)) {
            return TError{EErrorKind::InvalidReference,
                          fmt::format("Station {} does not exist", candidate.ResourceIdInternal)};
        }
        if (Users && !Users->FindUser(candidate.UserIdInternal)) {
            return TError{EErrorKind::InvalidReference,
                          fmt::format("User {} does not exist", candidate.UserIdInternal)};
        }
        return std::nullopt;
    }

    std::optional<TError> TReservationEngine::CheckEditable(const TReservation& current, const TReservation& merged) const {
        if (Options_.StatusPolicy == EStatusPolicy::Open) {
            return std::nullopt;
        }
        if (current.Status == EReservationStatus::Cancelled) {
            return TError{EErrorKind::IllegalTransition,
                          fmt::format("Reservation {} is cancelled and can no longer be modified", current.Id)};
        }
        if (current.EndTime <= Clock()) {
            return TError{EErrorKind::IllegalTransition,
                          fmt::format("Reservation {} has already elapsed", current.Id)};
        }
        if (!IsAllowedTransition(current.Status, merged.Status)) {
            return TError{EErrorKind::IllegalTransition,
                          fmt::format("Reservation {} cannot move from {} to {}", current.Id,
                                      StatusToString(current.Status), StatusToString(merged.Status))};
        }
        return std::nullopt;
    }

    std::optional<TError> TReservationEngine::CheckAvailability(const TReservation& candidate,
                                                                std::optional<ReservationId> self) const {
        bool ignoreCancelled = Options_.ExcludeCancelledFromConflicts;
        if (ignoreCancelled && candidate.Status == EReservationStatus::Cancelled) {
            return std::nullopt;
        }
        auto existing = Store->ListByResource(candidate.ResourceIdInternal);
        auto conflicts = FindConflicts(candidate.Window(), existing, self, ignoreCancelled);
        if (conflicts.empty()) {
            return std::nullopt;
        }
        return TError{EErrorKind::Conflict,
                      fmt::format("Station {} is not available from {} to {} (overlaps reservation {})",
                                  candidate.ResourceIdInternal, FormatTimestamp(candidate.StartTime),
                                  FormatTimestamp(candidate.EndTime), JoinIds(conflicts))};
    }

    TResult<TReservation> TReservationEngine::Create(const TReservationDraft& draft) {
        if (!(draft.StartTime < draft.EndTime)) {
            LogWarn("Rejected reservation on station {}: start {} is not before end {}", draft.ResourceIdInternal,
                    FormatTimestamp(draft.StartTime), FormatTimestamp(draft.EndTime));
            return TResult<TReservation>::Err(EErrorKind::Validation, "Start time must be before end time");
        }

        auto lock = Store->LockResources({draft.ResourceIdInternal});

        TReservation candidate;
        candidate.ResourceIdInternal = draft.ResourceIdInternal;
        candidate.UserIdInternal = draft.UserIdInternal;
        candidate.StartTime = draft.StartTime;
        candidate.EndTime = draft.EndTime;
        candidate.Status = draft.Status;
        if (auto err = CheckReferences(candidate)) {
            LogWarn("Rejected reservation: {}", err->Message);
            return TResult<TReservation>::Err(std::move(*err));
        }
        if (auto err = CheckAvailability(candidate, std::nullopt)) {
            LogWarn("Rejected reservation: {}", err->Message);
            return TResult<TReservation>::Err(std::move(*err));
        }

        auto created = Store->Insert(draft);
        if (created.IsErr()) {
            LogWarn("Insert failed ({}): {}", ErrorKindName(created.Error().Kind), created.Error().Message);
            return created;
        }
        const auto& r = created.Value();
        LogInfo("Created reservation {} on station {} for user {}: {} - {} ({})", r.Id, r.ResourceIdInternal,
                r.UserIdInternal, FormatTimestamp(r.StartTime), FormatTimestamp(r.EndTime), StatusToString(r.Status));
        return created;
    }

    TResult<TReservation> TReservationEngine::Update(ReservationId id, const TReservationPatch& patch) {
        for (;;) {
            auto found = Store->FindById(id);
            if (found.IsErr()) {
                return found;
            }

            std::vector<ResourceId> ids{found.Value().ResourceIdInternal};
            if (patch.ResourceIdInternal) {
                ids.push_back(*patch.ResourceIdInternal);
            }
            auto lock = Store->LockResources(ids);

            // Re-read under the lock; a concurrent update may have moved it.
            auto current = Store->FindById(id);
            if (current.IsErr()) {
                return current;
            }
            if (!lock.Holds(current.Value().ResourceIdInternal)) {
                continue;
            }

            TReservation merged = Merge(current.Value(), patch);
            if (!(merged.StartTime < merged.EndTime)) {
                LogWarn("Rejected update of reservation {}: start {} is not before end {}", id,
                        FormatTimestamp(merged.StartTime), FormatTimestamp(merged.EndTime));
                return TResult<TReservation>::Err(EErrorKind::Validation, "Start time must be before end time");
            }
            if (auto err = CheckReferences(merged)) {
                LogWarn("Rejected update of reservation {}: {}", id, err->Message);
                return TResult<TReservation>::Err(std::move(*err));
            }
            if (auto err = CheckAvailability(merged, id)) {
                LogWarn("Rejected update of reservation {}: {}", id, err->Message);
                return TResult<TReservation>::Err(std::move(*err));
            }
            if (auto err = CheckEditable(current.Value(), merged)) {
                LogWarn("Rejected update: {}", err->Message);
                return TResult<TReservation>::Err(std::move(*err));
            }

            auto updated = Store->UpdateById(id, patch);
            if (updated.IsErr()) {
                LogWarn("Update of reservation {} failed ({}): {}", id, ErrorKindName(updated.Error().Kind),
                        updated.Error().Message);
                return updated;
            }
            const auto& r = updated.Value();
            LogInfo("Updated reservation {} on station {}: {} - {} ({})", r.Id, r.ResourceIdInternal,
                    FormatTimestamp(r.StartTime), FormatTimestamp(r.EndTime), StatusToString(r.Status));
            return updated;
        }
    }

    TResult<void> TReservationEngine::Remove(ReservationId id) {
        auto removed = Store->DeleteById(id);
        if (removed.IsErr()) {
            LogWarn("Remove of reservation {} failed ({}): {}", id, ErrorKindName(removed.Error().Kind),
                    removed.Error().Message);
            return removed;
        }
        LogInfo("Removed reservation {}", id);
        return removed;
    }

    TResult<TReservationView> TReservationEngine::Get(ReservationId id) const {
        auto found = Store->FindById(id);
        if (found.IsErr()) {
            return TResult<TReservationView>::Err(found.Error());
        }
        return TResult<TReservationView>::Ok(Query.Attach(std::move(found).Value()));
    }

    TListPage TReservationEngine::List(const TListFilter& filter) const {
        return Query.Find(filter);
    }

    std::vector<TReservationView> TReservationEngine::ListAll() const {
        return Query.ListAll();
    }

    size_t TReservationEngine::Count() const {
        return Store->Count();
    }

} // namespace NReservation
