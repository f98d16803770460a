#pragma once
#include <set>
#include "ttFoundation.h"
#include "ttScript.h"

namespace tt {

ttDeclPtr(IInjector);
ttDeclPtr(IPlayer);

// performs the actual input. every call returns false on device error.
// implementations are not required to be thread safe.
class IInjector : public IObject
{
public:
    virtual bool moveAbsolute(int x, int y) = 0;
    virtual bool moveRelative(int dx, int dy) = 0;
    virtual bool buttonDown(int button) = 0;
    virtual bool buttonUp(int button) = 0;
    virtual bool keyDown(KeyCode key) = 0;
    virtual bool keyUp(KeyCode key) = 0;
    // press + release of the key(s) that produce c
    virtual bool typeCharacter(char32_t c) = 0;
    // optional. returns false if the position can't be known.
    virtual bool getMousePos(int2& dst) = 0;
};

// prints every call instead of sending it
ttAPI IInjector* CreatePrintInjector_();
ttDefShared(CreatePrintInjector);

#ifdef _WIN32
ttAPI IInjector* CreateSendInputInjector_();
ttDefShared(CreateSendInputInjector);
#endif


// keys / buttons held by one run, and the last known mouse position
class DeviceState
{
public:
    bool isHeld(KeyCode key) const;
    bool isHeld(int button) const;
    void hold(KeyCode key);
    void hold(int button);
    void unhold(KeyCode key);
    void unhold(int button);

    const std::set<KeyCode>& heldKeys() const;
    const std::set<int>& heldButtons() const;
    bool empty() const;

    void setMousePos(int2 v);
    void moveMouse(int2 delta);
    bool getMousePos(int2& dst) const;

private:
    std::set<KeyCode> m_keys;
    std::set<int> m_buttons;
    int2 m_mouse_pos{};
    bool m_mouse_pos_valid = false;
};


struct PlayerSettings
{
    millisec tick_interval = 16; // interpolation step of timed mouse moves
    bool verbose = false;
};

enum class PlayState : int
{
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed,
};
ttAPI const char* ToString(PlayState v);
inline bool IsTerminal(PlayState v) { return v >= PlayState::Completed; }

class IPlayer : public IObject
{
public:
    // starts playback on a worker thread. fails if the script has errors or the player was already started.
    virtual bool start(const Script& script) = 0;
    virtual void cancel() = 0;
    // blocks until the run reaches a terminal state
    virtual PlayState wait() = 0;
    // returns false on timeout
    virtual bool waitFor(millisec timeout) = 0;
    virtual PlayState getState() const = 0;
    // reason of the failure if getState() is Failed
    virtual std::string getError() const = 0;
    // snapshot of the device state. meaningful after the run has finished.
    virtual DeviceState getDeviceState() const = 0;
};
ttAPI IPlayer* CreatePlayer_(IInjector* injector, const PlayerSettings& settings = {});
ttDefShared(CreatePlayer);

} // namespace tt
