#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "helpers.hpp"

using namespace NReservation;
using namespace NReservation::NTest;

TEST(Conflicts, PartialOverlapFails) {
    TTestBed bed;

    auto first = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(first);

    auto second = bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T17:00:00Z"));
    ASSERT_TRUE(second.IsErr());
    EXPECT_EQ(second.Error().Kind, EErrorKind::Conflict);
    EXPECT_EQ(bed.Engine->Count(), 1u);
}

TEST(Conflicts, TouchingIntervalsAllowed) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T10:00:00Z", "2025-12-05T11:00:00Z")));
    EXPECT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T11:00:00Z", "2025-12-05T12:00:00Z")));
    EXPECT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T09:00:00Z", "2025-12-05T10:00:00Z")));
    EXPECT_EQ(bed.Engine->Count(), 3u);
}

TEST(Conflicts, FullyContainedFails) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T10:00:00Z", "2025-12-05T14:00:00Z")));

    auto inner = bed.Engine->Create(Draft(1, "2025-12-05T11:00:00Z", "2025-12-05T11:30:00Z"));
    ASSERT_TRUE(inner.IsErr());
    EXPECT_EQ(inner.Error().Kind, EErrorKind::Conflict);

    auto outer = bed.Engine->Create(Draft(1, "2025-12-05T09:00:00Z", "2025-12-05T15:00:00Z"));
    ASSERT_TRUE(outer.IsErr());
    EXPECT_EQ(outer.Error().Kind, EErrorKind::Conflict);
}

TEST(Conflicts, DifferentStationsNoConflict) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z")));
    EXPECT_TRUE(bed.Engine->Create(Draft(2, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z")));
}

TEST(Conflicts, ScenarioFollowUpSlotSucceeds) {
    TTestBed bed;

    auto first = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(first);
    EXPECT_FALSE(bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T17:00:00Z")));

    auto second = bed.Engine->Create(Draft(1, "2025-12-05T16:00:00Z", "2025-12-05T18:00:00Z"));
    ASSERT_TRUE(second);

    TReservationPatch move;
    move.StartTime = At("2025-12-05T16:00:00Z");
    move.EndTime = At("2025-12-05T18:00:00Z");
    auto moved = bed.Engine->Update(first.Value().Id, move);
    ASSERT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error().Kind, EErrorKind::Conflict);

    auto unchanged = bed.Engine->Get(first.Value().Id);
    ASSERT_TRUE(unchanged);
    EXPECT_EQ(unchanged.Value().Reservation.StartTime, At("2025-12-05T14:00:00Z"));
    EXPECT_EQ(unchanged.Value().Reservation.EndTime, At("2025-12-05T16:00:00Z"));
}

TEST(Conflicts, ScenarioOnSystemClockWithDefaults) {
    // Past reservations stay editable under the default options.
    auto storage = std::make_shared<TMemoryStorage>();
    auto catalog = MakeCatalog();
    auto store = std::make_shared<TReservationStore>(storage, catalog, catalog);
    TReservationEngine engine(store, catalog, catalog);

    auto first = engine.Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    auto second = engine.Create(Draft(1, "2025-12-05T16:00:00Z", "2025-12-05T18:00:00Z"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    TReservationPatch move;
    move.StartTime = At("2025-12-05T16:00:00Z");
    move.EndTime = At("2025-12-05T18:00:00Z");
    auto moved = engine.Update(first.Value().Id, move);
    ASSERT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error().Kind, EErrorKind::Conflict);

    TReservationPatch same;
    same.StartTime = At("2025-12-05T14:00:00Z");
    same.EndTime = At("2025-12-05T16:00:00Z");
    EXPECT_TRUE(engine.Update(first.Value().Id, same));

    TReservationPatch confirm;
    confirm.Status = EReservationStatus::Confirmed;
    auto confirmed = engine.Update(first.Value().Id, confirm);
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(confirmed.Value().Status, EReservationStatus::Confirmed);

    TReservationPatch back;
    back.Status = EReservationStatus::Pending;
    EXPECT_TRUE(engine.Update(first.Value().Id, back));
}

TEST(Conflicts, MessageNamesBlockingReservation) {
    TTestBed bed;

    auto first = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(first);
    auto second = bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T17:00:00Z"));
    ASSERT_TRUE(second.IsErr());
    EXPECT_NE(second.Error().Message.find("reservation " + std::to_string(first.Value().Id)), std::string::npos);
}

TEST(Conflicts, CancelledStillBlocksByDefault) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Cancelled)));

    auto res = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::Conflict);
}

TEST(Conflicts, CancelledIgnoredWhenExcluded) {
    TEngineOptions options;
    options.ExcludeCancelledFromConflicts = true;
    TTestBed bed(options);

    auto cancelled = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Cancelled));
    ASSERT_TRUE(cancelled);

    auto live = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(live);

    // another cancelled record may sit on a live window too
    EXPECT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Cancelled)));

    auto clash = bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(clash.IsErr());
    EXPECT_EQ(clash.Error().Kind, EErrorKind::Conflict);
}

TEST(Validation, InvertedOrEmptyWindowRejected) {
    TTestBed bed;

    auto inverted = bed.Engine->Create(Draft(1, "2025-12-05T16:00:00Z", "2025-12-05T14:00:00Z"));
    ASSERT_TRUE(inverted.IsErr());
    EXPECT_EQ(inverted.Error().Kind, EErrorKind::Validation);

    auto empty = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T14:00:00Z"));
    ASSERT_TRUE(empty.IsErr());
    EXPECT_EQ(empty.Error().Kind, EErrorKind::Validation);

    EXPECT_EQ(bed.Engine->Count(), 0u);
}

TEST(Validation, UpdateThatInvertsWindowRejected) {
    TTestBed bed;

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);

    TReservationPatch patch;
    patch.EndTime = At("2025-12-05T13:00:00Z");
    auto res = bed.Engine->Update(r.Value().Id, patch);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::Validation);
}

TEST(Validation, UnknownStationOrUserIsInvalidReference) {
    TTestBed bed;

    auto station = bed.Engine->Create(Draft(99, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(station.IsErr());
    EXPECT_EQ(station.Error().Kind, EErrorKind::InvalidReference);

    auto user = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Pending, 42));
    ASSERT_TRUE(user.IsErr());
    EXPECT_EQ(user.Error().Kind, EErrorKind::InvalidReference);

    auto ok = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(ok);
    TReservationPatch patch;
    patch.ResourceIdInternal = 77;
    auto moved = bed.Engine->Update(ok.Value().Id, patch);
    ASSERT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error().Kind, EErrorKind::InvalidReference);
}

TEST(Validation, UnknownReferenceReportedBeforeConflict) {
    TTestBed bed;

    auto taken = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(taken);

    auto user = bed.Engine->Create(Draft(1, "2025-12-05T15:00:00Z", "2025-12-05T17:00:00Z", EReservationStatus::Pending, 42));
    ASSERT_TRUE(user.IsErr());
    EXPECT_EQ(user.Error().Kind, EErrorKind::InvalidReference);

    auto other = bed.Engine->Create(Draft(2, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(other);
    TReservationPatch patch;
    patch.ResourceIdInternal = 1;
    patch.UserIdInternal = 42;
    auto moved = bed.Engine->Update(other.Value().Id, patch);
    ASSERT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error().Kind, EErrorKind::InvalidReference);

    EXPECT_EQ(bed.Engine->Count(), 2u);
}

TEST(Update, SelfExclusionSameWindow) {
    TTestBed bed;

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);

    TReservationPatch same;
    same.StartTime = At("2025-12-05T14:00:00Z");
    same.EndTime = At("2025-12-05T16:00:00Z");
    EXPECT_TRUE(bed.Engine->Update(r.Value().Id, same));

    TReservationPatch shifted;
    shifted.StartTime = At("2025-12-05T15:00:00Z");
    shifted.EndTime = At("2025-12-05T17:00:00Z");
    auto res = bed.Engine->Update(r.Value().Id, shifted);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.Value().StartTime, At("2025-12-05T15:00:00Z"));
    EXPECT_EQ(res.Value().EndTime, At("2025-12-05T17:00:00Z"));
}

TEST(Update, PartialPatchKeepsOtherFields) {
    TTestBed bed;

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);

    TReservationPatch patch;
    patch.EndTime = At("2025-12-05T18:00:00Z");
    auto res = bed.Engine->Update(r.Value().Id, patch);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.Value().ResourceIdInternal, 1u);
    EXPECT_EQ(res.Value().UserIdInternal, 2u);
    EXPECT_EQ(res.Value().StartTime, At("2025-12-05T14:00:00Z"));
    EXPECT_EQ(res.Value().EndTime, At("2025-12-05T18:00:00Z"));
    EXPECT_EQ(res.Value().Status, EReservationStatus::Pending);
}

TEST(Update, MoveToOtherStationChecksThatStation) {
    TTestBed bed;

    auto a = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    auto b = bed.Engine->Create(Draft(2, "2025-12-05T15:00:00Z", "2025-12-05T17:00:00Z"));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);

    TReservationPatch toBeta;
    toBeta.ResourceIdInternal = 2;
    auto blocked = bed.Engine->Update(a.Value().Id, toBeta);
    ASSERT_TRUE(blocked.IsErr());
    EXPECT_EQ(blocked.Error().Kind, EErrorKind::Conflict);

    TReservationPatch toGamma;
    toGamma.ResourceIdInternal = 3;
    auto moved = bed.Engine->Update(a.Value().Id, toGamma);
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved.Value().ResourceIdInternal, 3u);

    // station 1 is free again
    EXPECT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z")));
}

TEST(Update, MissingReservationNotFound) {
    TTestBed bed;

    TReservationPatch patch;
    patch.Status = EReservationStatus::Confirmed;
    auto res = bed.Engine->Update(12, patch);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::NotFound);
}

TEST(Status, StrictAllowsForwardTransitions) {
    TTestBed bed(StrictOptions());

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);

    TReservationPatch confirm;
    confirm.Status = EReservationStatus::Confirmed;
    auto confirmed = bed.Engine->Update(r.Value().Id, confirm);
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(confirmed.Value().Status, EReservationStatus::Confirmed);

    TReservationPatch cancel;
    cancel.Status = EReservationStatus::Cancelled;
    auto cancelled = bed.Engine->Update(r.Value().Id, cancel);
    ASSERT_TRUE(cancelled);
    EXPECT_EQ(cancelled.Value().Status, EReservationStatus::Cancelled);
}

TEST(Status, StrictRejectsBackwardTransition) {
    TTestBed bed(StrictOptions());

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Confirmed));
    ASSERT_TRUE(r);

    TReservationPatch back;
    back.Status = EReservationStatus::Pending;
    auto res = bed.Engine->Update(r.Value().Id, back);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::IllegalTransition);
}

TEST(Status, StrictFreezesCancelled) {
    TTestBed bed(StrictOptions());

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Cancelled));
    ASSERT_TRUE(r);

    TReservationPatch shift;
    shift.StartTime = At("2025-12-05T13:00:00Z");
    auto res = bed.Engine->Update(r.Value().Id, shift);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::IllegalTransition);
}

TEST(Status, StrictFreezesElapsed) {
    TTestBed bed(StrictOptions());

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);

    *bed.Clock.Now = At("2025-12-05T16:00:00Z");

    TReservationPatch confirm;
    confirm.Status = EReservationStatus::Confirmed;
    auto res = bed.Engine->Update(r.Value().Id, confirm);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::IllegalTransition);
}

TEST(Status, OpenPolicyWritesAnyStatus) {
    TEngineOptions options;
    options.StatusPolicy = EStatusPolicy::Open;
    TTestBed bed(options);

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Cancelled));
    ASSERT_TRUE(r);

    TReservationPatch revive;
    revive.Status = EReservationStatus::Pending;
    auto res = bed.Engine->Update(r.Value().Id, revive);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.Value().Status, EReservationStatus::Pending);
}

TEST(Status, TransitionTable) {
    using S = EReservationStatus;
    EXPECT_TRUE(IsAllowedTransition(S::Pending, S::Confirmed));
    EXPECT_TRUE(IsAllowedTransition(S::Pending, S::Cancelled));
    EXPECT_TRUE(IsAllowedTransition(S::Confirmed, S::Cancelled));
    EXPECT_TRUE(IsAllowedTransition(S::Confirmed, S::Confirmed));
    EXPECT_FALSE(IsAllowedTransition(S::Confirmed, S::Pending));
    EXPECT_FALSE(IsAllowedTransition(S::Cancelled, S::Pending));
    EXPECT_FALSE(IsAllowedTransition(S::Cancelled, S::Confirmed));
}

TEST(Reads, GetReturnsInputWithStationAndUser) {
    TTestBed bed;

    auto r = bed.Engine->Create(Draft(2, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z", EReservationStatus::Confirmed, 3));
    ASSERT_TRUE(r);

    auto view = bed.Engine->Get(r.Value().Id);
    ASSERT_TRUE(view);
    const auto& got = view.Value().Reservation;
    EXPECT_EQ(got.ResourceIdInternal, 2u);
    EXPECT_EQ(got.UserIdInternal, 3u);
    EXPECT_EQ(got.StartTime, At("2025-12-05T14:00:00Z"));
    EXPECT_EQ(got.EndTime, At("2025-12-05T16:00:00Z"));
    EXPECT_EQ(got.Status, EReservationStatus::Confirmed);
    EXPECT_EQ(got.CreatedAt, At("2025-12-01T00:00:00Z"));

    ASSERT_TRUE(view.Value().Resource);
    EXPECT_EQ(view.Value().Resource->Name, "Gaming Station Beta");
    ASSERT_TRUE(view.Value().User);
    EXPECT_EQ(view.Value().User->Username, "bob");
}

TEST(Reads, GetMissingNotFound) {
    TTestBed bed;

    auto res = bed.Engine->Get(5);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::NotFound);
}

TEST(Reads, PaginationNewestFirst) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T10:00:00Z", "2025-12-05T11:00:00Z")));
    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T15:00:00Z")));
    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T12:00:00Z", "2025-12-05T13:00:00Z")));

    TListFilter filter;
    filter.Limit = 1;
    filter.Offset = 1;
    auto page = bed.Engine->List(filter);
    EXPECT_EQ(page.Total, 3u);
    EXPECT_EQ(page.Count, 1u);
    ASSERT_EQ(page.Items.size(), 1u);
    EXPECT_EQ(page.Items[0].Reservation.StartTime, At("2025-12-05T12:00:00Z"));
}

TEST(Reads, ListDefaultsAndOffsetPastEnd) {
    TTestBed bed;

    for (int h = 0; h < 12; ++h) {
        TReservationDraft d = Draft(1, "2025-12-06T00:00:00Z", "2025-12-06T01:00:00Z");
        d.StartTime += std::chrono::hours(h);
        d.EndTime += std::chrono::hours(h);
        ASSERT_TRUE(bed.Engine->Create(d));
    }

    auto page = bed.Engine->List(TListFilter{});
    EXPECT_EQ(page.Total, 12u);
    EXPECT_EQ(page.Count, 10u);
    EXPECT_EQ(page.Items.front().Reservation.StartTime, At("2025-12-06T11:00:00Z"));

    TListFilter far;
    far.Offset = 50;
    auto empty = bed.Engine->List(far);
    EXPECT_EQ(empty.Total, 12u);
    EXPECT_EQ(empty.Count, 0u);
}

TEST(Reads, StatusFilterIsCaseInsensitive) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T10:00:00Z", "2025-12-05T11:00:00Z", EReservationStatus::Confirmed)));
    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T12:00:00Z", "2025-12-05T13:00:00Z")));
    ASSERT_TRUE(bed.Engine->Create(Draft(2, "2025-12-05T12:00:00Z", "2025-12-05T13:00:00Z", EReservationStatus::Confirmed)));

    TListFilter filter;
    filter.Status = "CONFIRMED";
    auto page = bed.Engine->List(filter);
    EXPECT_EQ(page.Total, 2u);
    for (auto const& v : page.Items) {
        EXPECT_EQ(v.Reservation.Status, EReservationStatus::Confirmed);
    }

    filter.Status = "booked";
    EXPECT_EQ(bed.Engine->List(filter).Total, 3u);
}

TEST(Reads, ListAllOldestFirst) {
    TTestBed bed;

    ASSERT_TRUE(bed.Engine->Create(Draft(2, "2025-12-07T10:00:00Z", "2025-12-07T11:00:00Z")));
    ASSERT_TRUE(bed.Engine->Create(Draft(1, "2025-12-05T10:00:00Z", "2025-12-05T11:00:00Z")));
    ASSERT_TRUE(bed.Engine->Create(Draft(3, "2025-12-06T10:00:00Z", "2025-12-06T11:00:00Z")));

    auto all = bed.Engine->ListAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].Reservation.ResourceIdInternal, 1u);
    EXPECT_EQ(all[1].Reservation.ResourceIdInternal, 3u);
    EXPECT_EQ(all[2].Reservation.ResourceIdInternal, 2u);
    ASSERT_TRUE(all[1].Resource);
    EXPECT_EQ(all[1].Resource->Name, "Gaming Station Gamma");
}

TEST(Remove, RemoveThenRecreateSameWindow) {
    TTestBed bed;

    auto r = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(r);
    ASSERT_TRUE(bed.Engine->Remove(r.Value().Id));
    EXPECT_EQ(bed.Engine->Count(), 0u);

    auto again = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z"));
    ASSERT_TRUE(again);
    EXPECT_NE(again.Value().Id, r.Value().Id);
}

TEST(Remove, MissingReservationNotFound) {
    TTestBed bed;

    auto res = bed.Engine->Remove(3);
    ASSERT_TRUE(res.IsErr());
    EXPECT_EQ(res.Error().Kind, EErrorKind::NotFound);
}

TEST(Multithreading, SameWindowOnlyOneWins) {
    TTestBed bed;

    constexpr int THREADS = 16;
    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> th;

    for (int t = 0; t < THREADS; t++) {
        th.emplace_back([&, t] {
            auto res = bed.Engine->Create(Draft(1, "2025-12-05T14:00:00Z", "2025-12-05T16:00:00Z",
                                                EReservationStatus::Pending, 1 + t % 3));
            if (res) {
                created++;
            } else if (res.Error().Kind == EErrorKind::Conflict) {
                conflicts++;
            }
        });
    }
    for (auto& x : th) {
        x.join();
    }

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(conflicts.load(), THREADS - 1);
    EXPECT_EQ(bed.Engine->Count(), 1u);
}

TEST(Multithreading, StaggeredWindowsKeepInvariant) {
    TTestBed bed;

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 20;
    std::vector<std::thread> th;

    for (int t = 0; t < THREADS; t++) {
        th.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; i++) {
                // every thread walks the same half-hour grid with one-hour windows
                TReservationDraft d = Draft(1 + (i % 3), "2025-12-05T00:00:00Z", "2025-12-05T01:00:00Z");
                d.StartTime += std::chrono::minutes(30 * ((i + t) % 10));
                d.EndTime += std::chrono::minutes(30 * ((i + t) % 10));
                auto res = bed.Engine->Create(d);
                (void)res;
            }
        });
    }
    for (auto& x : th) {
        x.join();
    }

    auto all = bed.Engine->ListAll();
    for (size_t i = 0; i < all.size(); ++i) {
        for (size_t j = i + 1; j < all.size(); ++j) {
            const auto& a = all[i].Reservation;
            const auto& b = all[j].Reservation;
            if (a.ResourceIdInternal != b.ResourceIdInternal) {
                continue;
            }
            EXPECT_FALSE(a.StartTime < b.EndTime && b.StartTime < a.EndTime)
                << "reservations " << a.Id << " and " << b.Id << " overlap";
        }
    }
}

TEST(Multithreading, ConcurrentMovesIntoSameSlot) {
    TTestBed bed;

    std::vector<ReservationId> ids;
    for (int h = 0; h < 6; ++h) {
        TReservationDraft d = Draft(1, "2025-12-05T00:00:00Z", "2025-12-05T01:00:00Z");
        d.StartTime += std::chrono::hours(h);
        d.EndTime += std::chrono::hours(h);
        auto r = bed.Engine->Create(d);
        ASSERT_TRUE(r);
        ids.push_back(r.Value().Id);
    }

    std::atomic<int> moved{0};
    std::vector<std::thread> th;
    for (auto id : ids) {
        th.emplace_back([&, id] {
            TReservationPatch patch;
            patch.StartTime = At("2025-12-05T20:00:00Z");
            patch.EndTime = At("2025-12-05T21:00:00Z");
            if (bed.Engine->Update(id, patch)) {
                moved++;
            }
        });
    }
    for (auto& x : th) {
        x.join();
    }

    EXPECT_EQ(moved.load(), 1);
    TListFilter filter;
    filter.Limit = 100;
    size_t inSlot = 0;
    for (auto const& v : bed.Engine->List(filter).Items) {
        if (v.Reservation.StartTime == At("2025-12-05T20:00:00Z")) {
            ++inSlot;
        }
    }
    EXPECT_EQ(inSlot, 1u);
}
