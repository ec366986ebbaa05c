#include <common.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <fmt/format.h>

namespace NReservation {

    namespace {

        std::string ToLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Exactly `width` ASCII digits.
        bool ReadDigits(const std::string& text, size_t& pos, size_t width, int& out) {
            if (pos + width > text.size()) {
                return false;
            }
            int value = 0;
            for (size_t i = 0; i < width; ++i) {
                char c = text[pos + i];
                if (c < '0' || c > '9') {
                    return false;
                }
                value = value * 10 + (c - '0');
            }
            out = value;
            pos += width;
            return true;
        }

        bool Expect(const std::string& text, size_t& pos, char c) {
            if (pos < text.size() && text[pos] == c) {
                ++pos;
                return true;
            }
            return false;
        }

    } // namespace

    std::string StatusToString(EReservationStatus status) {
        switch (status) {
            case EReservationStatus::Pending:
                return "pending";
            case EReservationStatus::Confirmed:
                return "confirmed";
            case EReservationStatus::Cancelled:
                return "cancelled";
        }
        return "pending";
    }

    std::optional<EReservationStatus> ParseStatus(const std::string& text) {
        auto lower = ToLower(text);
        if (lower == "pending") {
            return EReservationStatus::Pending;
        }
        if (lower == "confirmed") {
            return EReservationStatus::Confirmed;
        }
        if (lower == "cancelled") {
            return EReservationStatus::Cancelled;
        }
        return std::nullopt;
    }

    int64_t ToEpochMillis(TTimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    TTimePoint FromEpochMillis(int64_t millis) {
        return TTimePoint(std::chrono::duration_cast<TTimePoint::duration>(std::chrono::milliseconds(millis)));
    }

    std::string FormatTimestamp(TTimePoint tp) {
        using namespace std::chrono;
        auto secs = floor<seconds>(tp);
        auto millis = duration_cast<milliseconds>(tp - secs).count();
        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
        if (millis != 0) {
            return fmt::format("{}.{:03d}Z", buf, millis);
        }
        return fmt::format("{}Z", buf);
    }

    std::optional<TTimePoint> ParseTimestamp(const std::string& text) {
        size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
            !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
            !ReadDigits(text, pos, 2, day) || !(Expect(text, pos, 'T') || Expect(text, pos, 't')) ||
            !ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
            !ReadDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }

        int millis = 0;
        if (Expect(text, pos, ':')) {
            if (!ReadDigits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (Expect(text, pos, '.')) {
                int digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 3) {
                        millis = millis * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (int i = digits; i < 3; ++i) {
                    millis *= 10;
                }
            }
        }
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        }
        if (pos != text.size()) {
            return std::nullopt;
        }

        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }

        std::tm tm_buf{};
        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = second;
        std::time_t t = timegm(&tm_buf);

        // timegm normalises 2025-02-31 into March; reject instead.
        std::tm check{};
        gmtime_r(&t, &check);
        if (check.tm_year != year - 1900 || check.tm_mon != month - 1 || check.tm_mday != day) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
    }

    void ToJSON(json& j, const TReservation& r) {
        j = json{{"id", r.Id},
                 {"resource_id", r.ResourceIdInternal},
                 {"user_id", r.UserIdInternal},
                 {"start_time", ToEpochMillis(r.StartTime)},
                 {"end_time", ToEpochMillis(r.EndTime)},
                 {"status", StatusToString(r.Status)},
                 {"created_at", ToEpochMillis(r.CreatedAt)},
                 {"updated_at", ToEpochMillis(r.UpdatedAt)}};
    }

    void FromJSON(const json& j, TReservation& r) {
        r.Id = j.at("id").get<ReservationId>();
        r.ResourceIdInternal = j.at("resource_id").get<ResourceId>();
        r.UserIdInternal = j.at("user_id").get<UserId>();
        r.StartTime = FromEpochMillis(j.at("start_time").get<int64_t>());
        r.EndTime = FromEpochMillis(j.at("end_time").get<int64_t>());
        auto status = ParseStatus(j.at("status").get<std::string>());
        if (!status) {
            throw std::runtime_error("Unknown reservation status: " + j.at("status").get<std::string>());
        }
        r.Status = *status;
        if (j.contains("created_at")) {
            r.CreatedAt = FromEpochMillis(j.at("created_at").get<int64_t>());
        }
        if (j.contains("updated_at")) {
            r.UpdatedAt = FromEpochMillis(j.at("updated_at").get<int64_t>());
        }
    }

    void ToJSON(json& j, const TResourceInfo& r) {
        j = json{{"id", r.Id}, {"name", r.Name}, {"cpu", r.Cpu}, {"gpu", r.Gpu}, {"ram", r.Ram}, {"status", r.Availability}};
    }

    void FromJSON(const json& j, TResourceInfo& r) {
        r.Id = j.at("id").get<ResourceId>();
        r.Name = j.value("name", "");
        r.Cpu = j.value("cpu", "");
        r.Gpu = j.value("gpu", "");
        r.Ram = j.value("ram", "");
        r.Availability = j.value("status", "available");
    }

    void ToJSON(json& j, const TUserInfo& u) {
        j = json{{"id", u.Id}, {"username", u.Username}, {"email", u.Email}, {"role", u.Role}};
    }

    void FromJSON(const json& j, TUserInfo& u) {
        u.Id = j.at("id").get<UserId>();
        u.Username = j.value("username", "");
        u.Email = j.value("email", "");
        u.Role = j.value("role", "user");
    }

    json ViewToJSON(const TReservationView& view) {
        const auto& r = view.Reservation;
        json j = {{"id", r.Id},
                  {"resource_id", r.ResourceIdInternal},
                  {"user_id", r.UserIdInternal},
                  {"start_time", FormatTimestamp(r.StartTime)},
                  {"end_time", FormatTimestamp(r.EndTime)},
                  {"status", StatusToString(r.Status)},
                  {"created_at", FormatTimestamp(r.CreatedAt)},
                  {"updated_at", FormatTimestamp(r.UpdatedAt)}};
        if (view.Resource) {
            json station;
            ToJSON(station, *view.Resource);
            j["station"] = station;
        } else {
            j["station"] = nullptr;
        }
        if (view.User) {
            json user;
            ToJSON(user, *view.User);
            j["user"] = user;
        } else {
            j["user"] = nullptr;
        }
        return j;
    }

} // namespace NReservation
