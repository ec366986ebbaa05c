#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ReservationStore.hpp"

namespace NReservation {

    constexpr size_t DEFAULT_PAGE_LIMIT = 10;

    struct TListFilter {
        // Matched case-insensitively; an unknown value disables the filter.
        std::optional<std::string> Status;
        std::optional<size_t> Limit;
        std::optional<size_t> Offset;
    };

    struct TListPage {
        size_t Total = 0;
        size_t Count = 0;
        std::vector<TReservationView> Items;
    };

    // Builds a filter from raw request parameters ("status", "limit", "offset").
    // Non-numeric or non-positive limits and non-numeric or negative offsets
    // are dropped so the defaults apply.
    TListFilter ParseListFilter(const std::map<std::string, std::string>& params);

    // Read-only listing over the store with station and user attached.
    class TReservationQuery {
    public:
        TReservationQuery(std::shared_ptr<IReservationStore> store,
                          std::shared_ptr<const IResourceCatalog> resources,
                          std::shared_ptr<const IUserDirectory> users,
                          size_t defaultLimit = DEFAULT_PAGE_LIMIT);

        TListPage Find(const TListFilter& filter) const;
        std::vector<TReservationView> ListAll() const;

        TReservationView Attach(TReservation reservation) const;

    private:
        std::shared_ptr<IReservationStore> Store;
        std::shared_ptr<const IResourceCatalog> Resources;
        std::shared_ptr<const IUserDirectory> Users;
        size_t DefaultLimit;
    };

} // namespace NReservation
