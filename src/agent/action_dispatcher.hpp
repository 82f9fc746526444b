#pragma once
// =============================================================================
// DroidPilot - Action dispatcher
// =============================================================================
// Executes one parsed Action per call. Routes device primitives to the
// virtual-display channel when it is connected and requested, otherwise to the
// local executor. Waits and takeovers poll the cancel predicate every tick, so
// a stop request ends them within one tick.
//
// State flow per call:
//   Idle -> Executing -> {Succeeded | Failed | AwaitingConfirmation |
//                         AwaitingTakeover} -> Idle (next call)
// =============================================================================
#include <atomic>
#include <functional>
#include <optional>
#include <string>

#include "action.hpp"
#include "action_parser.hpp"
#include "app_catalog.hpp"
#include "coordinate_normalizer.hpp"
#include "device_executor.hpp"
#include "../remote/capabilities.hpp"

namespace droidpilot::agent {

struct DisplayContext {
    std::optional<int> display_id;      // virtual display, when one exists
    bool use_remote = true;             // prefer the remote channel
    bool normalize_coordinates = true;  // map 0..1000 model coordinates to pixels
};

struct ActionResult {
    bool success = false;
    bool should_finish = false;
    std::string message;
    bool requires_confirmation = false;
    bool cancelled = false;
};

class ActionDispatcher {
public:
    enum class State {
        Idle,
        Executing,
        Succeeded,
        Failed,
        AwaitingConfirmation,
        AwaitingTakeover
    };

    struct Options {
        int wait_tick_ms = 100;
        int takeover_tick_ms = 200;
        int takeover_ceiling_ms = 30000;
        int type_settle_before_ms = 500;
        int type_settle_after_ms = 300;
        int double_tap_gap_ms = 100;
        int long_press_ms = 1000;
        int default_swipe_ms = 300;
        bool unknown_is_fatal = false;
    };

    using ConfirmationCallback = std::function<bool(const std::string& message)>;
    using TakeoverCallback = std::function<void(const std::string& message)>;
    using CancelPredicate = std::function<bool()>;

    static constexpr const char* CANCELLED_MESSAGE = "Task stopped";
    static constexpr const char* DECLINED_MESSAGE = "User cancelled sensitive operation";

    // `remote` may be null (local-only mode)
    ActionDispatcher(DeviceExecutor& local, remote::InputInjector* remote,
                     const CoordinateNormalizer& normalizer, const AppCatalog& apps,
                     Options options);
    ActionDispatcher(DeviceExecutor& local, remote::InputInjector* remote,
                     const CoordinateNormalizer& normalizer, const AppCatalog& apps);

    void setConfirmationCallback(ConfirmationCallback cb) { confirm_ = std::move(cb); }
    void setTakeoverCallback(TakeoverCallback cb) { takeover_ = std::move(cb); }
    void setCancelPredicate(CancelPredicate pred) { cancel_ = std::move(pred); }

    ActionResult execute(const Action& action, const DisplayContext& ctx = {});

    // Parse + execute. A parse failure is a failed, non-fatal step.
    ActionResult executeText(const std::string& raw, const DisplayContext& ctx = {});

    State state() const { return state_.load(); }
    static const char* stateName(State s);

    const Options& options() const { return options_; }

private:
    ActionResult dispatch(const Action& action, const DisplayContext& ctx);

    ActionResult doLaunch(const actions::Launch& a, const DisplayContext& ctx);
    ActionResult doTap(Point p, const DisplayContext& ctx);
    ActionResult doDoubleTap(Point p, const DisplayContext& ctx);
    ActionResult doLongPress(Point p, const DisplayContext& ctx);
    ActionResult doType(const actions::Type& a);
    ActionResult doSwipe(const actions::Swipe& a, const DisplayContext& ctx);
    ActionResult doKey(int keycode, const DisplayContext& ctx);
    ActionResult doWait(const actions::Wait& a);
    ActionResult doTakeOver(const actions::TakeOver& a);

    bool routeRemote(const DisplayContext& ctx) const;
    Point resolve(Point p, const DisplayContext& ctx) const;
    bool isCancelled() const;
    // Sleeps `total_ms` in `tick_ms` steps; false as soon as cancellation is seen
    bool sleepCancellable(int total_ms, int tick_ms) const;
    void transition(State next);

    static ActionResult cancelledResult();

    DeviceExecutor& local_;
    remote::InputInjector* remote_;
    const CoordinateNormalizer& normalizer_;
    const AppCatalog& apps_;
    Options options_;
    ActionParser parser_;

    ConfirmationCallback confirm_;
    TakeoverCallback takeover_;
    CancelPredicate cancel_;

    std::atomic<State> state_{State::Idle};
};

} // namespace droidpilot::agent
