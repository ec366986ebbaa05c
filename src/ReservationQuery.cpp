#include <ReservationQuery.hpp>

#include <charconv>

namespace NReservation {

    namespace {

        // Leading integer of `text`, ignoring trailing garbage ("5abc" -> 5).
        std::optional<long long> LeadingInteger(const std::string& text) {
            long long value = 0;
            const char* first = text.data();
            const char* last = text.data() + text.size();
            while (first != last && *first == ' ') {
                ++first;
            }
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr == first) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    TListFilter ParseListFilter(const std::map<std::string, std::string>& params) {
        TListFilter filter;
        if (auto it = params.find("status"); it != params.end() && !it->second.empty()) {
            filter.Status = it->second;
        }
        if (auto it = params.find("limit"); it != params.end()) {
            auto v = LeadingInteger(it->second);
            if (v && *v > 0) {
                filter.Limit = static_cast<size_t>(*v);
            }
        }
        if (auto it = params.find("offset"); it != params.end()) {
            auto v = LeadingInteger(it->second);
            if (v && *v >= 0) {
                filter.Offset = static_cast<size_t>(*v);
            }
        }
        return filter;
    }

    TReservationQuery::TReservationQuery(std::shared_ptr<IReservationStore> store,
                                         std::shared_ptr<const IResourceCatalog> resources,
                                         std::shared_ptr<const IUserDirectory> users,
                                         size_t defaultLimit)
        : Store(std::move(store))
        , Resources(std::move(resources))
        , Users(std::move(users))
        , DefaultLimit(defaultLimit == 0 ? DEFAULT_PAGE_LIMIT : defaultLimit) {
    }

    TReservationView TReservationQuery::Attach(TReservation reservation) const {
        TReservationView view;
        if (Resources) {
            view.Resource = Resources->FindResource(reservation.ResourceIdInternal);
        }
        if (Users) {
            view.User = Users->FindUser(reservation.UserIdInternal);
        }
        view.Reservation = std::move(reservation);
        return view;
    }

    TListPage TReservationQuery::Find(const TListFilter& filter) const {
        std::optional<EReservationStatus> status;
        if (filter.Status) {
            status = ParseStatus(*filter.Status);
        }
        size_t limit = filter.Limit && *filter.Limit > 0 ? *filter.Limit : DefaultLimit;
        size_t offset = filter.Offset.value_or(0);

        auto page = Store->FindByFilter(status, limit, offset);

        TListPage out;
        out.Total = page.Total;
        out.Items.reserve(page.Items.size());
        for (auto& r : page.Items) {
            out.Items.push_back(Attach(std::move(r)));
        }
        out.Count = out.Items.size();
        return out;
    }

    std::vector<TReservationView> TReservationQuery::ListAll() const {
        std::vector<TReservationView> out;
        for (auto& r : Store->ListAll()) {
            out.push_back(Attach(std::move(r)));
        }
        return out;
    }

} // namespace NReservation
