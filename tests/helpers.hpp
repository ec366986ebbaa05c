#pragma once
#include <memory>
#include <stdexcept>
#include <string>

#include <ReservationEngine.hpp>
#include <catalog.hpp>
#include <storage.hpp>

namespace NReservation::NTest {

    inline TTimePoint At(const char* iso) {
        auto tp = ParseTimestamp(iso);
        if (!tp) {
            throw std::invalid_argument(std::string("bad test timestamp ") + iso);
        }
        return *tp;
    }

    // A clock the test can move.
    struct TManualClock {
        std::shared_ptr<TTimePoint> Now = std::make_shared<TTimePoint>(At("2025-12-01T00:00:00Z"));

        TClock AsClock() const {
            auto now = Now;
            return [now] { return *now; };
        }
    };

    inline std::shared_ptr<TMemoryCatalog> MakeCatalog() {
        auto catalog = std::make_shared<TMemoryCatalog>();
        catalog->AddResource(TResourceInfo{1, "Gaming Station Alpha", "Intel Core i9-14900KS", "NVIDIA RTX 4090 Ti", "64GB DDR5", "available"});
        catalog->AddResource(TResourceInfo{2, "Gaming Station Beta", "AMD Ryzen 9 7950X", "NVIDIA RTX 4080", "32GB DDR5", "available"});
        catalog->AddResource(TResourceInfo{3, "Gaming Station Gamma", "Intel Core i7-13700K", "NVIDIA RTX 4070 Ti", "16GB DDR5", "booked"});
        catalog->AddUser(TUserInfo{1, "admin", "admin@arena.test", "admin"});
        catalog->AddUser(TUserInfo{2, "alice", "alice@arena.test", "user"});
        catalog->AddUser(TUserInfo{3, "bob", "bob@arena.test", "user"});
        return catalog;
    }

    struct TTestBed {
        TManualClock Clock;
        std::shared_ptr<TMemoryStorage> Storage = std::make_shared<TMemoryStorage>();
        std::shared_ptr<TMemoryCatalog> Catalog = MakeCatalog();
        std::shared_ptr<TReservationStore> Store;
        std::shared_ptr<TReservationEngine> Engine;

        explicit TTestBed(TEngineOptions options = {}) {
            Store = std::make_shared<TReservationStore>(Storage, Catalog, Catalog, Clock.AsClock());
            Engine = std::make_shared<TReservationEngine>(Store, Catalog, Catalog, options, Clock.AsClock());
        }
    };

    inline TEngineOptions StrictOptions() {
        TEngineOptions options;
        options.StatusPolicy = EStatusPolicy::Strict;
        return options;
    }

    inline TReservationDraft Draft(ResourceId station, const char* start, const char* end,
                                   EReservationStatus status = EReservationStatus::Pending, UserId user = 2) {
        TReservationDraft d;
        d.ResourceIdInternal = station;
        d.UserIdInternal = user;
        d.StartTime = At(start);
        d.EndTime = At(end);
        d.Status = status;
        return d;
    }

} // namespace NReservation::NTest
