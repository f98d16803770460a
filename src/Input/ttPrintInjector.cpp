#include "pch.h"
#include "ttInternal.h"

namespace tt {

// dry run backend. tracks the mouse position so that timed absolute moves interpolate from somewhere sensible.
class PrintInjector : public RefCount<IInjector>
{
public:
    bool moveAbsolute(int x, int y) override;
    bool moveRelative(int dx, int dy) override;
    bool buttonDown(int button) override;
    bool buttonUp(int button) override;
    bool keyDown(KeyCode key) override;
    bool keyUp(KeyCode key) override;
    bool typeCharacter(char32_t c) override;
    bool getMousePos(int2& dst) override;

private:
    void print(const char* fmt, ...);

    millisec m_time_start = NowMS();
    int2 m_mouse_pos{};
};

void PrintInjector::print(const char* fmt, ...)
{
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    Print("[%6llums] %s\n", (unsigned long long)(NowMS() - m_time_start), buf);
}

bool PrintInjector::moveAbsolute(int x, int y)
{
    m_mouse_pos = { x, y };
    print("Move mouse to %d, %d", x, y);
    return true;
}

bool PrintInjector::moveRelative(int dx, int dy)
{
    m_mouse_pos += { dx, dy };
    print("Move mouse by %d, %d", dx, dy);
    return true;
}

bool PrintInjector::buttonDown(int button)
{
    print("Press mouse button %d", button);
    return true;
}

bool PrintInjector::buttonUp(int button)
{
    print("Release mouse button %d", button);
    return true;
}

bool PrintInjector::keyDown(KeyCode key)
{
    print("Press key %s", ToString(key).c_str());
    return true;
}

bool PrintInjector::keyUp(KeyCode key)
{
    print("Release key %s", ToString(key).c_str());
    return true;
}

bool PrintInjector::typeCharacter(char32_t c)
{
    if (c >= 0x20 && c < 0x7f)
        print("Type '%c'", (char)c);
    else
        print("Type U+%04X", (unsigned)c);
    return true;
}

bool PrintInjector::getMousePos(int2& dst)
{
    dst = m_mouse_pos;
    return true;
}

IInjector* CreatePrintInjector_()
{
    return new PrintInjector();
}

} // namespace tt
