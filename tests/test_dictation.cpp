#include "dictation.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <random>

using State = QuillStateMachine::State;
using Kind = DictationEvent::Kind;
using Indicator = Overlay::Indicator;

namespace {

Clock::duration secs(double s) {
    return std::chrono::round<Clock::duration>(std::chrono::duration<double>(s));
}

class DictationTest : public ::testing::Test {
protected:
    DictationTest()
        : dc_(params(), cap_, rec_, overlay_, inserter_) {}

    static DictationController::Params params() {
        DictationController::Params p;
        p.language = "en";
        p.min_recording_secs = 0.3;
        return p;
    }

    void SetUp() override { dc_.start(); }

    // A failed assertion must not leave the worker parked inside recognize().
    void TearDown() override { rec_.release(); }

    // Post a key event stamped t0 + at and handle it.
    void key(Kind k, double at) {
        dc_.post(DictationEvent::key(k, t0_ + secs(at)));
        ASSERT_TRUE(dc_.process_next(std::chrono::milliseconds(1000)));
    }

    // Handle the recognition completion for the current session.
    void await_recognition() {
        ASSERT_TRUE(dc_.process_next(std::chrono::seconds(5)));
    }

    void record(double down, double up) {
        key(Kind::HotkeyDown, down);
        key(Kind::HotkeyUp, up);
    }

    FakeCapture cap_;
    FakeRecognizer rec_;
    FakeOverlay overlay_;
    FakeInserter inserter_;
    DictationController dc_;
    Clock::time_point t0_ = Clock::now();
};

} // namespace

TEST_F(DictationTest, HoldReleaseConfirmInsertsText) {
    key(Kind::HotkeyDown, 0.0);
    EXPECT_EQ(dc_.state(), State::Recording);
    EXPECT_TRUE(cap_.running());
    EXPECT_EQ(overlay_.last().what, Indicator::Recording);

    key(Kind::HotkeyUp, 1.0);
    EXPECT_EQ(dc_.state(), State::Processing);
    EXPECT_FALSE(cap_.running());
    EXPECT_EQ(overlay_.last().what, Indicator::Processing);

    await_recognition();
    EXPECT_EQ(dc_.state(), State::AwaitingConfirm);
    EXPECT_EQ(dc_.pending_text(), "hello");
    EXPECT_EQ(overlay_.last().what, Indicator::Result);
    EXPECT_EQ(overlay_.last().text, "hello");

    key(Kind::Confirm, 2.0);
    EXPECT_EQ(dc_.state(), State::Idle);
    ASSERT_EQ(inserter_.inserted.size(), 1u);
    EXPECT_EQ(inserter_.inserted[0], "hello");
    EXPECT_FALSE(dc_.has_session());
    EXPECT_FALSE(overlay_.visible);

    EXPECT_EQ(rec_.calls(), 1);
    EXPECT_EQ(rec_.sizes()[0], cap_.samples.size());
    EXPECT_EQ(rec_.language(), "en");
}

TEST_F(DictationTest, TooShortRecordingNeverReachesRecognizer) {
    record(0.0, 0.1);

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_FALSE(dc_.has_session());
    EXPECT_FALSE(cap_.running());
    EXPECT_EQ(cap_.stops, 1);
    EXPECT_EQ(overlay_.last().what, Indicator::Notice);

    EXPECT_FALSE(dc_.process_next(std::chrono::milliseconds(100)));
    EXPECT_EQ(rec_.calls(), 0);
}

TEST_F(DictationTest, MinimumDurationItselfIsLongEnough) {
    record(0.0, 0.3);
    EXPECT_EQ(dc_.state(), State::Processing);
    await_recognition();
    EXPECT_EQ(rec_.calls(), 1);
}

TEST_F(DictationTest, CancelDiscardsPendingTextAndLaterConfirmIsNoop) {
    record(0.0, 1.0);
    await_recognition();
    ASSERT_EQ(dc_.state(), State::AwaitingConfirm);

    key(Kind::Cancel, 1.5);
    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_TRUE(dc_.pending_text().empty());
    EXPECT_FALSE(overlay_.visible);

    key(Kind::Confirm, 2.0);
    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_TRUE(inserter_.inserted.empty());
}

TEST_F(DictationTest, HotkeyDownWhileAwaitingConfirmIsIgnored) {
    rec_.set_reply(RecognitionResult::success("test"));
    record(0.0, 1.0);
    await_recognition();
    ASSERT_EQ(dc_.state(), State::AwaitingConfirm);
    const uint64_t id = dc_.session_id();

    key(Kind::HotkeyDown, 2.0);
    EXPECT_EQ(dc_.state(), State::AwaitingConfirm);
    EXPECT_EQ(dc_.session_id(), id);
    EXPECT_EQ(dc_.pending_text(), "test");
    EXPECT_EQ(cap_.starts, 1);
    EXPECT_FALSE(cap_.running());
}

// The default chord shares its key with confirm, so one press posts both.
TEST_F(DictationTest, ChordPressWithConfirmKeyInsertsPendingText) {
    record(0.0, 1.0);
    await_recognition();
    ASSERT_EQ(dc_.state(), State::AwaitingConfirm);

    key(Kind::HotkeyDown, 2.0);
    key(Kind::Confirm, 2.0);
    EXPECT_EQ(dc_.state(), State::Idle);
    ASSERT_EQ(inserter_.inserted.size(), 1u);
    EXPECT_EQ(inserter_.inserted[0], "hello");
    EXPECT_EQ(cap_.starts, 1);

    // From Idle the same pair starts a recording; the confirm is dropped.
    key(Kind::HotkeyDown, 3.0);
    key(Kind::Confirm, 3.0);
    EXPECT_EQ(dc_.state(), State::Recording);
    EXPECT_TRUE(cap_.running());
    EXPECT_EQ(inserter_.inserted.size(), 1u);
}

TEST_F(DictationTest, EmptyAudioReturnsToIdleWithoutInsertion) {
    cap_.samples.clear();
    record(0.0, 1.0);
    await_recognition();

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_FALSE(dc_.has_session());
    EXPECT_EQ(overlay_.last().what, Indicator::Error);
    EXPECT_EQ(overlay_.last().text, error_kind_message(ErrorKind::EmptyAudio));

    key(Kind::Confirm, 2.0);
    EXPECT_TRUE(inserter_.inserted.empty());
}

TEST_F(DictationTest, RecognizerFailureIsTerminalForSession) {
    rec_.set_reply(RecognitionResult::failure(ErrorKind::InferenceError, "boom"));
    record(0.0, 1.0);
    await_recognition();

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_EQ(overlay_.last().text, error_kind_message(ErrorKind::InferenceError));
    EXPECT_EQ(rec_.calls(), 1);

    // The user re-triggers; nothing is retried on their behalf.
    EXPECT_FALSE(dc_.process_next(std::chrono::milliseconds(100)));
    EXPECT_EQ(rec_.calls(), 1);
}

TEST_F(DictationTest, BlankTranscriptCountsAsEmptyAudio) {
    rec_.set_reply(RecognitionResult::success(""));
    record(0.0, 1.0);
    await_recognition();

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_EQ(overlay_.last().text, error_kind_message(ErrorKind::EmptyAudio));
}

TEST_F(DictationTest, KeyRepeatWhileRecordingIsIdempotent) {
    key(Kind::HotkeyDown, 0.0);
    const uint64_t id = dc_.session_id();

    key(Kind::HotkeyDown, 0.5);
    key(Kind::HotkeyDown, 0.6);

    EXPECT_EQ(dc_.state(), State::Recording);
    EXPECT_EQ(dc_.session_id(), id);
    EXPECT_EQ(cap_.starts, 1);
}

TEST_F(DictationTest, StrayHotkeyUpIsIgnored) {
    key(Kind::HotkeyUp, 0.0);
    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_EQ(cap_.stops, 0);

    rec_.hold();
    record(1.0, 2.0);
    ASSERT_EQ(dc_.state(), State::Processing);
    key(Kind::HotkeyUp, 2.1);
    EXPECT_EQ(dc_.state(), State::Processing);
    EXPECT_EQ(cap_.stops, 1);

    rec_.release();
    await_recognition();
    key(Kind::HotkeyUp, 3.0);
    EXPECT_EQ(dc_.state(), State::AwaitingConfirm);
}

TEST_F(DictationTest, CancelDuringProcessingSuppressesLateResult) {
    rec_.hold();
    record(0.0, 1.0);
    ASSERT_TRUE(rec_.wait_entered(1));
    const uint64_t cancelled_id = dc_.session_id();

    key(Kind::Cancel, 1.2);
    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_FALSE(dc_.has_session());

    rec_.release();
    await_recognition();  // stale completion for cancelled_id
    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_TRUE(dc_.pending_text().empty());
    for (const auto& s : overlay_.shown) EXPECT_NE(s.what, Indicator::Result);

    key(Kind::Confirm, 2.0);
    EXPECT_TRUE(inserter_.inserted.empty());
    EXPECT_NE(cancelled_id, 0u);
}

TEST_F(DictationTest, StaleResultDoesNotLandInNextSession) {
    rec_.hold();
    record(0.0, 1.0);
    ASSERT_TRUE(rec_.wait_entered(1));
    key(Kind::Cancel, 1.1);

    // New session starts while the old inference is still running.
    key(Kind::HotkeyDown, 2.0);
    const uint64_t second = dc_.session_id();
    ASSERT_EQ(dc_.state(), State::Recording);

    rec_.release();
    await_recognition();  // completion of the first session
    EXPECT_EQ(dc_.state(), State::Recording);
    EXPECT_EQ(dc_.session_id(), second);

    key(Kind::HotkeyUp, 3.0);
    await_recognition();
    EXPECT_EQ(dc_.state(), State::AwaitingConfirm);
    EXPECT_EQ(rec_.calls(), 2);
}

TEST_F(DictationTest, CancelWhileRecordingClosesCapture) {
    key(Kind::HotkeyDown, 0.0);
    key(Kind::Cancel, 0.5);

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_FALSE(cap_.running());
    EXPECT_EQ(cap_.stops, 1);
    EXPECT_FALSE(dc_.process_next(std::chrono::milliseconds(100)));
    EXPECT_EQ(rec_.calls(), 0);
}

TEST_F(DictationTest, CaptureFailureSurfacesErrorAndReturnsToIdle) {
    cap_.fail_start = true;
    key(Kind::HotkeyDown, 0.0);

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_FALSE(dc_.has_session());
    EXPECT_EQ(overlay_.last().what, Indicator::Error);
    EXPECT_EQ(overlay_.last().text, error_kind_message(ErrorKind::DeviceUnavailable));

    cap_.fail_start = false;
    key(Kind::HotkeyDown, 1.0);
    EXPECT_EQ(dc_.state(), State::Recording);
}

TEST_F(DictationTest, TooShortNoticeClearsAfterTwoSeconds) {
    record(0.0, 0.1);
    ASSERT_EQ(overlay_.last().what, Indicator::Notice);
    ASSERT_TRUE(overlay_.visible);

    dc_.expire_notice(Clock::now() + secs(1.0));
    EXPECT_TRUE(overlay_.visible);

    dc_.expire_notice(Clock::now() + secs(2.5));
    EXPECT_FALSE(overlay_.visible);

    // Only once.
    const int hides = overlay_.hides;
    dc_.expire_notice(Clock::now() + secs(10.0));
    EXPECT_EQ(overlay_.hides, hides);
}

TEST_F(DictationTest, ErrorIndicatorClearsAfterTwoSeconds) {
    cap_.fail_start = true;
    key(Kind::HotkeyDown, 0.0);
    ASSERT_EQ(overlay_.last().what, Indicator::Error);

    dc_.expire_notice(Clock::now() + secs(2.5));
    EXPECT_FALSE(overlay_.visible);
    EXPECT_EQ(dc_.state(), State::Idle);
}

TEST_F(DictationTest, NewRecordingKeepsItsIndicator) {
    record(0.0, 0.1);
    ASSERT_EQ(overlay_.last().what, Indicator::Notice);

    key(Kind::HotkeyDown, 1.0);
    ASSERT_EQ(overlay_.last().what, Indicator::Recording);

    dc_.expire_notice(Clock::now() + secs(5.0));
    EXPECT_TRUE(overlay_.visible);
    EXPECT_EQ(dc_.state(), State::Recording);
}

TEST_F(DictationTest, InsertFailureDiscardsTextAndResets) {
    inserter_.fail_with = ErrorKind::NoFocusTarget;
    record(0.0, 1.0);
    await_recognition();
    key(Kind::Confirm, 2.0);

    EXPECT_EQ(dc_.state(), State::Idle);
    EXPECT_TRUE(dc_.pending_text().empty());
    EXPECT_EQ(overlay_.last().what, Indicator::Error);
    EXPECT_EQ(overlay_.last().text, error_kind_message(ErrorKind::NoFocusTarget));

    // No retry on the next confirm.
    inserter_.fail_with = ErrorKind::None;
    key(Kind::Confirm, 3.0);
    EXPECT_TRUE(inserter_.inserted.empty());
}

TEST_F(DictationTest, ShutdownWhileRecordingClosesDevice) {
    key(Kind::HotkeyDown, 0.0);
    ASSERT_TRUE(cap_.running());

    key(Kind::Shutdown, 0.5);
    EXPECT_EQ(dc_.state(), State::Shutdown);
    EXPECT_FALSE(cap_.running());

    dc_.post(DictationEvent::key(Kind::HotkeyDown, t0_ + secs(1.0)));
    EXPECT_FALSE(dc_.process_next(std::chrono::milliseconds(50)));
    EXPECT_EQ(cap_.starts, 1);
}

TEST_F(DictationTest, StopClosesOpenCapture) {
    key(Kind::HotkeyDown, 0.0);
    dc_.stop();
    EXPECT_FALSE(cap_.running());
    EXPECT_EQ(dc_.state(), State::Shutdown);
    dc_.stop();
}

TEST_F(DictationTest, ObserverSeesInsertedTransientState) {
    std::vector<State> seen;
    dc_.set_observer([&](State, State to, QuillStateMachine::Event, const std::string&) {
        seen.push_back(to);
    });

    record(0.0, 1.0);
    await_recognition();
    key(Kind::Confirm, 2.0);

    const std::vector<State> want = {
        State::Recording, State::Processing, State::AwaitingConfirm, State::Inserted, State::Idle,
    };
    EXPECT_EQ(seen, want);
    dc_.set_observer(nullptr);
}

TEST_F(DictationTest, RandomEventSequencesKeepOneSession) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 3);
    std::uniform_real_distribution<double> gap(0.0, 0.6);

    const Kind kinds[] = {Kind::HotkeyDown, Kind::HotkeyUp, Kind::Confirm, Kind::Cancel};

    int sessions_started = 0;
    uint64_t last_id = 0;
    double t = 0.0;

    for (int i = 0; i < 1000; ++i) {
        t += gap(rng);
        dc_.post(DictationEvent::key(kinds[pick(rng)], t0_ + secs(t)));

        // Drain what is queued; occasionally give the worker time to answer.
        const auto wait = (i % 5 == 0) ? std::chrono::milliseconds(20) : std::chrono::milliseconds(0);
        while (dc_.process_next(wait)) {}

        const State st = dc_.state();
        if (dc_.has_session() && dc_.session_id() != last_id) {
            last_id = dc_.session_id();
            sessions_started++;
        }

        switch (st) {
            case State::Idle:
                ASSERT_FALSE(dc_.has_session());
                ASSERT_FALSE(cap_.running());
                ASSERT_TRUE(dc_.pending_text().empty());
                break;
            case State::Recording:
                ASSERT_TRUE(dc_.has_session());
                ASSERT_TRUE(cap_.running());
                break;
            case State::Processing:
                ASSERT_TRUE(dc_.has_session());
                ASSERT_FALSE(cap_.running());
                break;
            case State::AwaitingConfirm:
                ASSERT_TRUE(dc_.has_session());
                ASSERT_FALSE(cap_.running());
                ASSERT_FALSE(dc_.pending_text().empty());
                break;
            default:
                FAIL() << "unexpected state " << QuillStateMachine::state_name(st);
        }
    }

    EXPECT_EQ(cap_.starts, sessions_started);
    EXPECT_LE(rec_.calls(), cap_.starts);
    EXPECT_LE(inserter_.inserted.size(), (size_t)rec_.calls());
}
