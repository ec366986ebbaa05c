#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace NReservation {

    using json = nlohmann::json;

    using TTimePoint = std::chrono::system_clock::time_point;

    using ReservationId = uint64_t;
    using ResourceId = uint64_t;
    using UserId = uint64_t;

    enum class EReservationStatus {
        Pending,
        Confirmed,
        Cancelled
    };

    // Half-open window [Start, End).
    struct TInterval {
        TTimePoint Start;
        TTimePoint End;
    };

    struct TReservation {
        ReservationId Id = 0;
        ResourceId ResourceIdInternal = 0;
        UserId UserIdInternal = 0;
        TTimePoint StartTime;
        TTimePoint EndTime;
        EReservationStatus Status = EReservationStatus::Pending;
        TTimePoint CreatedAt;
        TTimePoint UpdatedAt;

        TInterval Window() const {
            return TInterval{StartTime, EndTime};
        }
    };

    struct TReservationDraft {
        ResourceId ResourceIdInternal = 0;
        UserId UserIdInternal = 0;
        TTimePoint StartTime;
        TTimePoint EndTime;
        EReservationStatus Status = EReservationStatus::Pending;
    };

    // Absent fields keep the value already stored.
    struct TReservationPatch {
        std::optional<ResourceId> ResourceIdInternal;
        std::optional<UserId> UserIdInternal;
        std::optional<TTimePoint> StartTime;
        std::optional<TTimePoint> EndTime;
        std::optional<EReservationStatus> Status;
    };

    // A gaming station as known by the external catalog.
    struct TResourceInfo {
        ResourceId Id = 0;
        std::string Name;
        std::string Cpu;
        std::string Gpu;
        std::string Ram;
        std::string Availability;
    };

    struct TUserInfo {
        UserId Id = 0;
        std::string Username;
        std::string Email;
        std::string Role;
    };

    struct TReservationView {
        TReservation Reservation;
        std::optional<TResourceInfo> Resource;
        std::optional<TUserInfo> User;
    };

    std::string StatusToString(EReservationStatus status);
    // Case-insensitive.
    std::optional<EReservationStatus> ParseStatus(const std::string& text);

    int64_t ToEpochMillis(TTimePoint tp);
    TTimePoint FromEpochMillis(int64_t millis);

    // ISO-8601 UTC, e.g. "2025-12-05T14:00:00Z". Seconds, fraction and the
    // trailing 'Z' are optional on input.
    std::string FormatTimestamp(TTimePoint tp);
    std::optional<TTimePoint> ParseTimestamp(const std::string& text);

    void ToJSON(json& j, const TReservation& r);
    void FromJSON(const json& j, TReservation& r);

    void ToJSON(json& j, const TResourceInfo& r);
    void FromJSON(const json& j, TResourceInfo& r);
    void ToJSON(json& j, const TUserInfo& u);
    void FromJSON(const json& j, TUserInfo& u);

    // Human-facing rendering: ISO timestamps, attached station and user.
    json ViewToJSON(const TReservationView& view);

} // namespace NReservation
