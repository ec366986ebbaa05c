#include <ReservationStore.hpp>
#include <log.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace NReservation {

    bool TResourceLock::Holds(ResourceId id) const {
        return std::find(Ids.begin(), Ids.end(), id) != Ids.end();
    }

    TResourceLock TResourceLockTable::Acquire(std::vector<ResourceId> ids) {
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        TResourceLock lock;
        {
            std::lock_guard lk(Mutex_);
            for (auto id : ids) {
                auto& slot = Table[id];
                if (!slot) {
                    slot = std::make_shared<std::mutex>();
                }
                lock.Mutexes.push_back(slot);
            }
        }
        for (auto& m : lock.Mutexes) {
            lock.Locks.emplace_back(*m);
        }
        lock.Ids = std::move(ids);
        return lock;
    }

    TReservationStore::TReservationStore(std::shared_ptr<IStorage> storage,
                                         std::shared_ptr<const IResourceCatalog> resources,
                                         std::shared_ptr<const IUserDirectory> users,
                                         TClock clock)
        : Storage(std::move(storage))
        , Resources(std::move(resources))
        , Users(std::move(users))
        , Clock(std::move(clock)) {
        Reload();
    }

    void TReservationStore::Reload() {
        std::lock_guard lk(Mutex_);
        Reservations.clear();
        NextId = 1;

        nlohmann::json snap = Storage->LoadState();
        if (!snap.is_object()) {
            return;
        }
        try {
            if (snap.contains("reservations") && snap["reservations"].is_array()) {
                for (auto const& jr : snap["reservations"]) {
                    TReservation r;
                    FromJSON(jr, r);
                    NextId = std::max(NextId, r.Id + 1);
                    Reservations[r.Id] = r;
                }
            }
            if (snap.contains("next_id")) {
                NextId = std::max(NextId, snap["next_id"].get<ReservationId>());
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Corrupt reservation snapshot: ") + e.what());
        }
        LogDebug("Loaded {} reservations, next id {}", Reservations.size(), NextId);
    }

    nlohmann::json TReservationStore::Snapshot(const TTable& table, ReservationId nextId) const {
        nlohmann::json snap = nlohmann::json::object();
        snap["next_id"] = nextId;
        snap["reservations"] = nlohmann::json::array();
        for (auto const& kv : table) {
            nlohmann::json j;
            ToJSON(j, kv.second);
            snap["reservations"].push_back(j);
        }
        return snap;
    }

    std::optional<TError> TReservationStore::Commit(TTable next, ReservationId nextId, const nlohmann::json& journalEntry) {
        try {
            Storage->SaveState(Snapshot(next, nextId));
        } catch (const std::exception& e) {
            LogError("Reservation snapshot write failed: {}", e.what());
            return TError{EErrorKind::StoreUnavailable, std::string("Reservation storage unavailable: ") + e.what()};
        }
        Reservations.swap(next);
        NextId = nextId;

        // The snapshot is authoritative; the journal is an audit trail.
        try {
            Storage->AppendJournal(journalEntry);
        } catch (const std::exception& e) {
            LogError("Reservation journal append failed: {}", e.what());
        }
        return std::nullopt;
    }

    std::optional<TError> TReservationStore::CheckReferences(ResourceId resource, UserId user) const {
        if (Resources && !Resources->FindResource(resource)) {
            return TError{EErrorKind::InvalidReference, "Station " + std::to_string(resource) + " does not exist"};
        }
        if (Users && !Users->FindUser(user)) {
            return TError{EErrorKind::InvalidReference, "User " + std::to_string(user) + " does not exist"};
        }
        return std::nullopt;
    }

    size_t TReservationStore::Count() {
        std::lock_guard lk(Mutex_);
        return Reservations.size();
    }

    std::vector<TReservation> TReservationStore::ListByResource(ResourceId resource) {
        std::lock_guard lk(Mutex_);
        std::vector<TReservation> out;
        for (auto const& kv : Reservations) {
            if (kv.second.ResourceIdInternal == resource) {
                out.push_back(kv.second);
            }
        }
        return out;
    }

    TStorePage TReservationStore::FindByFilter(std::optional<EReservationStatus> status, size_t limit, size_t offset) {
        std::vector<TReservation> matched;
        {
            std::lock_guard lk(Mutex_);
            for (auto const& kv : Reservations) {
                if (status && kv.second.Status != *status) {
                    continue;
                }
                matched.push_back(kv.second);
            }
        }
        std::stable_sort(matched.begin(), matched.end(), [](const TReservation& a, const TReservation& b) {
            return a.StartTime > b.StartTime;
        });

        TStorePage page;
        page.Total = matched.size();
        if (offset >= matched.size()) {
            return page;
        }
        auto first = matched.begin() + static_cast<std::ptrdiff_t>(offset);
        auto last = matched.size() - offset > limit ? first + static_cast<std::ptrdiff_t>(limit) : matched.end();
        page.Items.assign(std::make_move_iterator(first), std::make_move_iterator(last));
        return page;
    }

    std::vector<TReservation> TReservationStore::ListAll() {
        std::vector<TReservation> out;
        {
            std::lock_guard lk(Mutex_);
            out.reserve(Reservations.size());
            for (auto const& kv : Reservations) {
                out.push_back(kv.second);
            }
        }
        std::stable_sort(out.begin(), out.end(), [](const TReservation& a, const TReservation& b) {
            return a.StartTime < b.StartTime;
        });
        return out;
    }

    TResult<TReservation> TReservationStore::FindById(ReservationId id) {
        std::lock_guard lk(Mutex_);
        auto it = Reservations.find(id);
        if (it == Reservations.end()) {
            return TResult<TReservation>::Err(EErrorKind::NotFound, "Reservation " + std::to_string(id) + " not found");
        }
        return TResult<TReservation>::Ok(it->second);
    }

    TResult<TReservation> TReservationStore::Insert(const TReservationDraft& draft) {
        if (!(draft.StartTime < draft.EndTime)) {
            return TResult<TReservation>::Err(EErrorKind::Validation, "Start time must be before end time");
        }
        if (auto err = CheckReferences(draft.ResourceIdInternal, draft.UserIdInternal)) {
            return TResult<TReservation>::Err(std::move(*err));
        }

        std::lock_guard lk(Mutex_);
        auto now = Clock();
        TReservation nr;
        nr.Id = NextId;
        nr.ResourceIdInternal = draft.ResourceIdInternal;
        nr.UserIdInternal = draft.UserIdInternal;
        nr.StartTime = draft.StartTime;
        nr.EndTime = draft.EndTime;
        nr.Status = draft.Status;
        nr.CreatedAt = now;
        nr.UpdatedAt = now;

        TTable next = Reservations;
        next[nr.Id] = nr;

        nlohmann::json je = {{"op", "create"}, {"at", ToEpochMillis(now)}};
        ToJSON(je["reservation"], nr);
        if (auto err = Commit(std::move(next), nr.Id + 1, je)) {
            return TResult<TReservation>::Err(std::move(*err));
        }
        return TResult<TReservation>::Ok(nr);
    }

    TResult<TReservation> TReservationStore::UpdateById(ReservationId id, const TReservationPatch& patch) {
        std::lock_guard lk(Mutex_);
        auto it = Reservations.find(id);
        if (it == Reservations.end()) {
            return TResult<TReservation>::Err(EErrorKind::NotFound, "Reservation " + std::to_string(id) + " not found");
        }

        TReservation updated = it->second;
        if (patch.ResourceIdInternal) {
            updated.ResourceIdInternal = *patch.ResourceIdInternal;
        }
        if (patch.UserIdInternal) {
            updated.UserIdInternal = *patch.UserIdInternal;
        }
        if (patch.StartTime) {
            updated.StartTime = *patch.StartTime;
        }
        if (patch.EndTime) {
            updated.EndTime = *patch.EndTime;
        }
        if (patch.Status) {
            updated.Status = *patch.Status;
        }
        if (!(updated.StartTime < updated.EndTime)) {
            return TResult<TReservation>::Err(EErrorKind::Validation, "Start time must be before end time");
        }
        if (auto err = CheckReferences(updated.ResourceIdInternal, updated.UserIdInternal)) {
            return TResult<TReservation>::Err(std::move(*err));
        }
        updated.UpdatedAt = Clock();

        TTable next = Reservations;
        next[id] = updated;

        nlohmann::json je = {{"op", "update"}, {"at", ToEpochMillis(updated.UpdatedAt)}};
        ToJSON(je["reservation"], updated);
        if (auto err = Commit(std::move(next), NextId, je)) {
            return TResult<TReservation>::Err(std::move(*err));
        }
        return TResult<TReservation>::Ok(updated);
    }

    TResult<void> TReservationStore::DeleteById(ReservationId id) {
        std::lock_guard lk(Mutex_);
        if (Reservations.find(id) == Reservations.end()) {
            return TResult<void>::Err(EErrorKind::NotFound, "Reservation " + std::to_string(id) + " not found");
        }

        TTable next = Reservations;
        next.erase(id);

        nlohmann::json je = {{"op", "remove"}, {"id", id}, {"at", ToEpochMillis(Clock())}};
        if (auto err = Commit(std::move(next), NextId, je)) {
            return TResult<void>::Err(std::move(*err));
        }
        return TResult<void>::Ok();
    }

    TResourceLock TReservationStore::LockResources(std::vector<ResourceId> ids) {
        return LockTable.Acquire(std::move(ids));
    }

} // namespace NReservation
