// =============================================================================
// DroidPilot - Action dispatcher
// =============================================================================
#include "action_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <type_traits>
#include <variant>

#include "../droidpilot_log.hpp"

namespace droidpilot::agent {

namespace {

constexpr const char* TAG = "Dispatcher";
constexpr const char* DEFAULT_TAKEOVER_MESSAGE =
    "Please complete the operation on the device, then continue";

void sleepMs(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

ActionResult ok(std::string message = {}) {
    ActionResult r;
    r.success = true;
    r.message = std::move(message);
    return r;
}

ActionResult fail(std::string message, bool should_finish = false) {
    ActionResult r;
    r.success = false;
    r.should_finish = should_finish;
    r.message = std::move(message);
    return r;
}

ActionResult fromBool(bool success, const std::string& what) {
    return success ? ok() : fail(what + " failed");
}

} // namespace

ActionDispatcher::ActionDispatcher(DeviceExecutor& local, remote::InputInjector* remote,
                                   const CoordinateNormalizer& normalizer,
                                   const AppCatalog& apps, Options options)
    : local_(local),
      remote_(remote),
      normalizer_(normalizer),
      apps_(apps),
      options_(options),
      parser_(options.default_swipe_ms) {}

ActionDispatcher::ActionDispatcher(DeviceExecutor& local, remote::InputInjector* remote,
                                   const CoordinateNormalizer& normalizer,
                                   const AppCatalog& apps)
    : ActionDispatcher(local, remote, normalizer, apps, Options{}) {}

const char* ActionDispatcher::stateName(State s) {
    switch (s) {
        case State::Idle:                 return "Idle";
        case State::Executing:            return "Executing";
        case State::Succeeded:            return "Succeeded";
        case State::Failed:               return "Failed";
        case State::AwaitingConfirmation: return "AwaitingConfirmation";
        case State::AwaitingTakeover:     return "AwaitingTakeover";
    }
    return "?";
}

void ActionDispatcher::transition(State next) {
    State prev = state_.exchange(next);
    if (prev != next) {
        DPLOG_TRACE(TAG, "%s -> %s", stateName(prev), stateName(next));
    }
}

bool ActionDispatcher::isCancelled() const {
    return cancel_ && cancel_();
}

bool ActionDispatcher::sleepCancellable(int total_ms, int tick_ms) const {
    tick_ms = std::max(1, tick_ms);
    int elapsed = 0;
    while (elapsed < total_ms) {
        if (isCancelled()) return false;
        int step = std::min(tick_ms, total_ms - elapsed);
        sleepMs(step);
        elapsed += step;
    }
    return true;
}

ActionResult ActionDispatcher::cancelledResult() {
    ActionResult r = fail(CANCELLED_MESSAGE, true);
    r.cancelled = true;
    return r;
}

bool ActionDispatcher::routeRemote(const DisplayContext& ctx) const {
    return ctx.use_remote && remote_ != nullptr && remote_->isConnected();
}

Point ActionDispatcher::resolve(Point p, const DisplayContext& ctx) const {
    if (!ctx.normalize_coordinates) return p;
    Point out = normalizer_.resolve(p);
    if (out != p) {
        DPLOG_DEBUG(TAG, "Normalized (%d,%d) -> (%d,%d)", p.x, p.y, out.x, out.y);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Entry points
// -----------------------------------------------------------------------------

ActionResult ActionDispatcher::executeText(const std::string& raw, const DisplayContext& ctx) {
    auto parsed = parser_.parse(raw);
    if (parsed.is_err()) {
        DPLOG_WARN(TAG, "Unparseable action: %s", parsed.error().message.c_str());
        transition(State::Failed);
        return fail("Unknown action: " + parsed.error().message);
    }
    return execute(parsed.value(), ctx);
}

ActionResult ActionDispatcher::execute(const Action& action, const DisplayContext& ctx) {
    transition(State::Idle);
    transition(State::Executing);
    DPLOG_INFO(TAG, "Executing %s", kindName(action.kind()));

    ActionResult result;
    try {
        result = dispatch(action, ctx);
    } catch (const std::exception& e) {
        DPLOG_ERROR(TAG, "Action failed: %s", e.what());
        result = fail(std::string("Action failed: ") + e.what());
    }

    transition(result.success ? State::Succeeded : State::Failed);
    if (!result.success) {
        DPLOG_WARN(TAG, "%s failed: %s", kindName(action.kind()), result.message.c_str());
    }
    return result;
}

ActionResult ActionDispatcher::dispatch(const Action& action, const DisplayContext& ctx) {
    if (const auto* fin = action.as<actions::Finish>()) {
        ActionResult r = ok(fin->message);
        r.should_finish = true;
        return r;
    }

    bool confirmed = false;
    if (action.requiresConfirmation()) {
        transition(State::AwaitingConfirmation);
        if (confirm_) {
            confirmed = confirm_(action.message());
        } else {
            DPLOG_WARN(TAG, "No confirmation handler; declining sensitive action");
        }
        if (!confirmed) {
            ActionResult r = fail(DECLINED_MESSAGE, true);
            r.requires_confirmation = true;
            return r;
        }
        transition(State::Executing);
    }

    ActionResult r = std::visit([&](const auto& a) -> ActionResult {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, actions::Launch>) {
            return doLaunch(a, ctx);
        } else if constexpr (std::is_same_v<T, actions::Tap>) {
            return doTap(a.at, ctx);
        } else if constexpr (std::is_same_v<T, actions::DoubleTap>) {
            return doDoubleTap(a.at, ctx);
        } else if constexpr (std::is_same_v<T, actions::LongPress>) {
            return doLongPress(a.at, ctx);
        } else if constexpr (std::is_same_v<T, actions::Type>) {
            return doType(a);
        } else if constexpr (std::is_same_v<T, actions::Swipe>) {
            return doSwipe(a, ctx);
        } else if constexpr (std::is_same_v<T, actions::Back>) {
            return doKey(KEYCODE_BACK, ctx);
        } else if constexpr (std::is_same_v<T, actions::Home>) {
            return doKey(KEYCODE_HOME, ctx);
        } else if constexpr (std::is_same_v<T, actions::Wait>) {
            return doWait(a);
        } else if constexpr (std::is_same_v<T, actions::TakeOver>) {
            return doTakeOver(a);
        } else if constexpr (std::is_same_v<T, actions::Interact>) {
            return ok("User interaction required");
        } else if constexpr (std::is_same_v<T, actions::Note> ||
                             std::is_same_v<T, actions::CallApi>) {
            return ok();
        } else if constexpr (std::is_same_v<T, actions::Unknown>) {
            return fail("Unknown action: " + a.name, options_.unknown_is_fatal);
        } else {
            // Finish is handled above
            return ok();
        }
    }, action.payload());

    r.requires_confirmation = confirmed;
    return r;
}

// -----------------------------------------------------------------------------
// Handlers
// -----------------------------------------------------------------------------

ActionResult ActionDispatcher::doLaunch(const actions::Launch& a, const DisplayContext& ctx) {
    auto package = apps_.resolve(a.app);
    if (!package) return fail("App not found: " + a.app);

    bool sent = routeRemote(ctx) ? remote_->launchApp(*package) : local_.launchApp(*package);
    return fromBool(sent, "launch " + *package);
}

ActionResult ActionDispatcher::doTap(Point p, const DisplayContext& ctx) {
    Point px = resolve(p, ctx);
    bool sent = routeRemote(ctx) ? remote_->tap(px.x, px.y) : local_.tap(px.x, px.y);
    return fromBool(sent, "tap");
}

ActionResult ActionDispatcher::doDoubleTap(Point p, const DisplayContext& ctx) {
    Point px = resolve(p, ctx);
    const bool remote = routeRemote(ctx);
    bool first = remote ? remote_->tap(px.x, px.y) : local_.tap(px.x, px.y);
    sleepMs(options_.double_tap_gap_ms);
    bool second = remote ? remote_->tap(px.x, px.y) : local_.tap(px.x, px.y);
    return fromBool(first && second, "double tap");
}

ActionResult ActionDispatcher::doLongPress(Point p, const DisplayContext& ctx) {
    Point px = resolve(p, ctx);
    const int ms = options_.long_press_ms;
    bool sent = routeRemote(ctx) ? remote_->swipe(px.x, px.y, px.x, px.y, ms)
                                 : local_.swipe(px.x, px.y, px.x, px.y, ms);
    return fromBool(sent, "long press");
}

ActionResult ActionDispatcher::doType(const actions::Type& a) {
    if (a.text.empty()) return ok();

    // Text always goes through the local input path
    sleepMs(options_.type_settle_before_ms);
    bool typed = local_.inputText(a.text);
    sleepMs(options_.type_settle_after_ms);

    if (!typed) return fail("Failed to type text: " + a.text);
    return ok();
}

ActionResult ActionDispatcher::doSwipe(const actions::Swipe& a, const DisplayContext& ctx) {
    Point from = resolve(a.from, ctx);
    Point to = resolve(a.to, ctx);
    bool sent = routeRemote(ctx)
        ? remote_->swipe(from.x, from.y, to.x, to.y, a.duration_ms)
        : local_.swipe(from.x, from.y, to.x, to.y, a.duration_ms);
    return fromBool(sent, "swipe");
}

ActionResult ActionDispatcher::doKey(int keycode, const DisplayContext& ctx) {
    bool sent = routeRemote(ctx) ? remote_->key(keycode) : local_.keyEvent(keycode);
    return fromBool(sent, "key " + std::to_string(keycode));
}

ActionResult ActionDispatcher::doWait(const actions::Wait& a) {
    DPLOG_DEBUG(TAG, "Waiting %d ms", a.duration_ms);
    if (!sleepCancellable(a.duration_ms, options_.wait_tick_ms)) {
        DPLOG_INFO(TAG, "Wait cancelled");
        return cancelledResult();
    }
    return ok();
}

ActionResult ActionDispatcher::doTakeOver(const actions::TakeOver& a) {
    if (isCancelled()) return cancelledResult();

    const std::string message = a.message.empty() ? DEFAULT_TAKEOVER_MESSAGE : a.message;
    transition(State::AwaitingTakeover);
    DPLOG_INFO(TAG, "Takeover requested: %s", message.c_str());
    if (takeover_) takeover_(message);

    if (!sleepCancellable(options_.takeover_ceiling_ms, options_.takeover_tick_ms)) {
        DPLOG_INFO(TAG, "Takeover cancelled");
        return cancelledResult();
    }
    return ok();
}

} // namespace droidpilot::agent
