#include "pch.h"
#include "ttInternal.h"

namespace tt {

const char* ToString(PlayState v)
{
    switch (v) {
    case PlayState::Idle: return "Idle";
    case PlayState::Running: return "Running";
    case PlayState::Completed: return "Completed";
    case PlayState::Cancelled: return "Cancelled";
    case PlayState::Failed: return "Failed";
    default: return "";
    }
}

class Player : public RefCount<IPlayer>
{
public:
    using clock = std::chrono::steady_clock;

    Player(IInjector* injector, const PlayerSettings& settings);
    ~Player() override;
    bool start(const Script& script) override;
    void cancel() override;
    PlayState wait() override;
    bool waitFor(millisec timeout) override;
    PlayState getState() const override;
    std::string getError() const override;
    DeviceState getDeviceState() const override;

private:
    enum class Result
    {
        Ok,
        Cancelled,
        DeviceError,
    };

    void run();
    Result dispatch(DeviceState& device, const Action& action, clock::time_point due);
    Result moveMouse(DeviceState& device, const Action& action, clock::time_point due);
    Result releaseHeld(DeviceState& device, ReleaseTarget target);
    void drain(DeviceState& device);
    Result deviceError(std::string what);

    // returns false if cancellation was requested before t
    bool waitUntil(clock::time_point t);

    IInjectorPtr m_injector;
    PlayerSettings m_settings;
    Timeline m_timeline;
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_cancel_requested = false;
    PlayState m_state = PlayState::Idle;
    std::string m_error;
    DeviceState m_device;

    // worker only
    std::string m_run_error;
};


Player::Player(IInjector* injector, const PlayerSettings& settings)
    : m_injector(injector)
    , m_settings(settings)
{
    if (m_settings.tick_interval == 0)
        m_settings.tick_interval = 1;
}

Player::~Player()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_requested = true;
    }
    m_cond.notify_all();
    if (m_thread.joinable())
        m_thread.join();
}

bool Player::start(const Script& script)
{
    if (!m_injector)
        return false;
    if (!script.valid()) {
        ttDbgPrint("*** script has %d error(s), not starting ***\n", (int)script.errors.size());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != PlayState::Idle)
            return false;
        m_timeline = script.timeline;
        m_state = PlayState::Running;
    }
    m_thread = std::thread([this]() { run(); });
    return true;
}

void Player::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlayState::Idle)
            m_state = PlayState::Cancelled;
        else if (!IsTerminal(m_state))
            m_cancel_requested = true;
    }
    m_cond.notify_all();
}

PlayState Player::wait()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait(lock, [this]() { return m_state != PlayState::Running; });
    return m_state;
}

bool Player::waitFor(millisec timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cond.wait_for(lock, std::chrono::milliseconds(timeout), [this]() { return m_state != PlayState::Running; });
}

PlayState Player::getState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::string Player::getError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

DeviceState Player::getDeviceState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_device;
}

bool Player::waitUntil(clock::time_point t)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cond.wait_until(lock, t, [this]() { return m_cancel_requested; });
}

void Player::run()
{
    DeviceState device;
    int2 pos;
    if (m_injector->getMousePos(pos))
        device.setMousePos(pos);

    auto time_start = clock::now();
    Result result = Result::Ok;
    for (auto& e : m_timeline) {
        auto due = time_start + std::chrono::milliseconds(e.time);
        if (!waitUntil(due)) {
            result = Result::Cancelled;
            break;
        }

        if (m_settings.verbose)
            Print("At %llums: %s\n", (unsigned long long)e.time, e.action.toText().c_str());
        result = dispatch(device, e.action, due);
        if (result != Result::Ok)
            break;
    }

    // held input never outlives the run
    drain(device);

    PlayState state = PlayState::Completed;
    if (result == Result::Cancelled)
        state = PlayState::Cancelled;
    else if (result == Result::DeviceError)
        state = PlayState::Failed;
    ttDbgPrint("playback finished: %s\n", ToString(state));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = state;
        m_error = m_run_error;
        m_device = device;
    }
    m_cond.notify_all();
}

Player::Result Player::deviceError(std::string what)
{
    // the first error is the one reported
    if (m_run_error.empty())
        m_run_error = std::move(what);
    return Result::DeviceError;
}

Player::Result Player::dispatch(DeviceState& device, const Action& action, clock::time_point due)
{
    switch (action.type)
    {
    case ActionType::MouseMoveAbs:
    case ActionType::MouseMoveRel:
        return moveMouse(device, action, due);

    case ActionType::MouseDown:
    {
        int button = action.data.mouse.button;
        if (device.isHeld(button))
            break;
        if (!m_injector->buttonDown(button))
            return deviceError(Format("buttonDown(%d) failed", button));
        device.hold(button);
        break;
    }

    case ActionType::MouseUp:
    {
        int button = action.data.mouse.button;
        if (!device.isHeld(button))
            break;
        if (!m_injector->buttonUp(button))
            return deviceError(Format("buttonUp(%d) failed", button));
        device.unhold(button);
        break;
    }

    case ActionType::KeyDown:
    {
        auto key = action.data.key.code;
        if (device.isHeld(key))
            break;
        if (!m_injector->keyDown(key))
            return deviceError(Format("keyDown(%s) failed", ToString(key).c_str()));
        device.hold(key);
        break;
    }

    case ActionType::KeyUp:
    {
        auto key = action.data.key.code;
        if (!device.isHeld(key))
            break;
        if (!m_injector->keyUp(key))
            return deviceError(Format("keyUp(%s) failed", ToString(key).c_str()));
        device.unhold(key);
        break;
    }

    case ActionType::Release:
        return releaseHeld(device, action.data.release.target);

    case ActionType::Text:
        for (char32_t c : ToUTF32(action.text)) {
            if (!m_injector->typeCharacter(c))
                return deviceError(Format("typeCharacter(U+%04X) failed", (unsigned)c));
        }
        break;

    default:
        break;
    }
    return Result::Ok;
}

Player::Result Player::moveMouse(DeviceState& device, const Action& action, clock::time_point due)
{
    bool relative = action.type == ActionType::MouseMoveRel;
    int2 target{ action.data.move.x, action.data.move.y };
    millisec duration = action.data.move.duration;

    auto move = [&](int2 v) {
        if (relative) {
            if (!m_injector->moveRelative(v.x, v.y))
                return deviceError(Format("moveRelative(%d, %d) failed", v.x, v.y));
            device.moveMouse(v);
        }
        else {
            if (!m_injector->moveAbsolute(v.x, v.y))
                return deviceError(Format("moveAbsolute(%d, %d) failed", v.x, v.y));
            device.setMousePos(v);
        }
        return Result::Ok;
    };

    if (duration == 0)
        return move(target);

    // n evenly spaced steps, the last one at due + duration.
    // positions are rounded per step from the exact line so that errors don't accumulate.
    // 64 bit: target - origin doesn't fit in int when they are far apart on a multi monitor desktop
    int2 origin{};
    if (!relative && !device.getMousePos(origin))
        origin = target;
    int64_t ox = relative ? 0 : origin.x;
    int64_t oy = relative ? 0 : origin.y;
    int64_t dx = (int64_t)target.x - ox;
    int64_t dy = (int64_t)target.y - oy;

    millisec tick = m_settings.tick_interval;
    int64_t n = (int64_t)((duration + tick - 1) / tick);
    auto lerp = [n](int64_t d, int64_t i) {
        return i == n ? d : (int64_t)std::llround(double(d) * double(i) / double(n));
    };

    int64_t done_x = 0, done_y = 0;
    for (int64_t i = 1; i <= n; ++i) {
        // duration * i can exceed 64 bit in microseconds for long moves
        auto offset = std::chrono::duration<double, std::milli>(double(duration) * double(i) / double(n));
        auto t = due + std::chrono::duration_cast<clock::duration>(offset);
        if (!waitUntil(t))
            return Result::Cancelled;

        int64_t cx = lerp(dx, i), cy = lerp(dy, i);
        // both results lie between the start and the target, so they fit in int
        int2 v = relative ?
            int2{ (int)(cx - done_x), (int)(cy - done_y) } :
            int2{ (int)(ox + cx), (int)(oy + cy) };
        auto r = move(v);
        if (r != Result::Ok)
            return r;
        done_x = cx;
        done_y = cy;
    }
    return Result::Ok;
}

Player::Result Player::releaseHeld(DeviceState& device, ReleaseTarget target)
{
    if ((int)target & (int)ReleaseTarget::Key) {
        auto keys = device.heldKeys();
        for (auto key : keys) {
            if (!m_injector->keyUp(key))
                return deviceError(Format("keyUp(%s) failed", ToString(key).c_str()));
            device.unhold(key);
        }
    }
    if ((int)target & (int)ReleaseTarget::Mouse) {
        auto buttons = device.heldButtons();
        for (auto button : buttons) {
            if (!m_injector->buttonUp(button))
                return deviceError(Format("buttonUp(%d) failed", button));
            device.unhold(button);
        }
    }
    return Result::Ok;
}

// best effort. failures are logged and don't change the outcome of the run.
void Player::drain(DeviceState& device)
{
    auto keys = device.heldKeys();
    for (auto key : keys) {
        if (!m_injector->keyUp(key))
            Print("*** failed to release key %s ***\n", ToString(key).c_str());
        device.unhold(key);
    }
    auto buttons = device.heldButtons();
    for (auto button : buttons) {
        if (!m_injector->buttonUp(button))
            Print("*** failed to release mouse button %d ***\n", button);
        device.unhold(button);
    }
}

IPlayer* CreatePlayer_(IInjector* injector, const PlayerSettings& settings)
{
    return new Player(injector, settings);
}

} // namespace tt
