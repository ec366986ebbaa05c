#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "catalog.hpp"
#include "common.hpp"
#include "result.hpp"
#include "storage.hpp"

namespace NReservation {

    using TClock = std::function<TTimePoint()>;

    // Exclusive hold on one or more resources for the duration of a
    // read-check-write sequence. Released on destruction.
    class TResourceLock {
    public:
        TResourceLock() = default;
        TResourceLock(TResourceLock&&) = default;
        TResourceLock& operator=(TResourceLock&&) = default;

        bool Holds(ResourceId id) const;

    private:
        friend class TResourceLockTable;

        std::vector<ResourceId> Ids;
        std::vector<std::shared_ptr<std::mutex>> Mutexes;
        std::vector<std::unique_lock<std::mutex>> Locks;
    };

    class TResourceLockTable {
    public:
        // Locks are taken in ascending id order so that two callers asking
        // for overlapping sets cannot deadlock.
        TResourceLock Acquire(std::vector<ResourceId> ids);

    private:
        std::mutex Mutex_;
        std::unordered_map<ResourceId, std::shared_ptr<std::mutex>> Table;
    };

    struct TStorePage {
        size_t Total = 0;
        std::vector<TReservation> Items;
    };

    struct IReservationStore {
        virtual ~IReservationStore() = default;

        virtual size_t Count() = 0;
        // Any status; the conflict candidate set.
        virtual std::vector<TReservation> ListByResource(ResourceId resource) = 0;
        // Newest start time first. An absent status means no filter.
        virtual TStorePage FindByFilter(std::optional<EReservationStatus> status, size_t limit, size_t offset) = 0;
        // Oldest start time first, no pagination.
        virtual std::vector<TReservation> ListAll() = 0;

        virtual TResult<TReservation> FindById(ReservationId id) = 0;
        virtual TResult<TReservation> Insert(const TReservationDraft& draft) = 0;
        virtual TResult<TReservation> UpdateById(ReservationId id, const TReservationPatch& patch) = 0;
        virtual TResult<void> DeleteById(ReservationId id) = 0;

        virtual TResourceLock LockResources(std::vector<ResourceId> ids) = 0;
    };

    class TReservationStore: public IReservationStore {
    public:
        // Reloads the table from the backend snapshot; throws
        // std::runtime_error if the snapshot cannot be read or parsed.
        TReservationStore(std::shared_ptr<IStorage> storage,
                          std::shared_ptr<const IResourceCatalog> resources,
                          std::shared_ptr<const IUserDirectory> users,
                          TClock clock = [] { return std::chrono::system_clock::now(); });

        size_t Count() override;
        std::vector<TReservation> ListByResource(ResourceId resource) override;
        TStorePage FindByFilter(std::optional<EReservationStatus> status, size_t limit, size_t offset) override;
        std::vector<TReservation> ListAll() override;

        TResult<TReservation> FindById(ReservationId id) override;
        TResult<TReservation> Insert(const TReservationDraft& draft) override;
        TResult<TReservation> UpdateById(ReservationId id, const TReservationPatch& patch) override;
        TResult<void> DeleteById(ReservationId id) override;

        TResourceLock LockResources(std::vector<ResourceId> ids) override;

    private:
        using TTable = std::map<ReservationId, TReservation>;

        void Reload();
        std::optional<TError> CheckReferences(ResourceId resource, UserId user) const;
        // Persists `next` and swaps it in. On failure the live table is untouched.
        std::optional<TError> Commit(TTable next, ReservationId nextId, const nlohmann::json& journalEntry);
        nlohmann::json Snapshot(const TTable& table, ReservationId nextId) const;

    private:
        std::shared_ptr<IStorage> Storage;
        std::shared_ptr<const IResourceCatalog> Resources;
        std::shared_ptr<const IUserDirectory> Users;
        TClock Clock;

        std::mutex Mutex_;
        TTable Reservations;
        ReservationId NextId = 1;

        TResourceLockTable LockTable;
    };

} // namespace NReservation
