#include "pch.h"
#include "ttInternal.h"

#ifdef _WIN32
namespace tt {

class SendInputInjector : public RefCount<IInjector>
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
    bool send(INPUT* inputs, UINT n);
    bool sendButton(int button, bool down);
    bool sendKey(KeyCode key, bool down);
};

static WORD ToVirtualKey(KeyCode key)
{
    int code = (int)key;
    if (code >= 'a' && code <= 'z')
        return (WORD)std::toupper(code);
    if (code >= '0' && code <= '9')
        return (WORD)code;

    switch (key) {
    case (KeyCode)'`': return VK_OEM_3;
    case (KeyCode)'-': return VK_OEM_MINUS;
    case (KeyCode)'=': return VK_OEM_PLUS;
    case (KeyCode)'[': return VK_OEM_4;
    case (KeyCode)']': return VK_OEM_6;
    case (KeyCode)'\\': return VK_OEM_5;
    case (KeyCode)';': return VK_OEM_1;
    case (KeyCode)'\'': return VK_OEM_7;
    case (KeyCode)',': return VK_OEM_COMMA;
    case (KeyCode)'.': return VK_OEM_PERIOD;
    case (KeyCode)'/': return VK_OEM_2;

    case KeyCode::Backspace: return VK_BACK;
    case KeyCode::Tab: return VK_TAB;
    case KeyCode::Enter: return VK_RETURN;
    case KeyCode::Escape: return VK_ESCAPE;
    case KeyCode::Space: return VK_SPACE;
    case KeyCode::Delete: return VK_DELETE;
    case KeyCode::Insert: return VK_INSERT;
    case KeyCode::Home: return VK_HOME;
    case KeyCode::End: return VK_END;
    case KeyCode::PageUp: return VK_PRIOR;
    case KeyCode::PageDown: return VK_NEXT;
    case KeyCode::Left: return VK_LEFT;
    case KeyCode::Right: return VK_RIGHT;
    case KeyCode::Up: return VK_UP;
    case KeyCode::Down: return VK_DOWN;
    case KeyCode::Shift: return VK_SHIFT;
    case KeyCode::Control: return VK_CONTROL;
    case KeyCode::Alt: return VK_MENU;
    case KeyCode::Super: return VK_LWIN;
    case KeyCode::CapsLock: return VK_CAPITAL;
    default: break;
    }

    if (key >= KeyCode::F1 && key <= KeyCode::F20)
        return (WORD)(VK_F1 + ((int)key - (int)KeyCode::F1));
    return 0;
}

bool SendInputInjector::send(INPUT* inputs, UINT n)
{
    UINT sent = ::SendInput(n, inputs, sizeof(INPUT));
    if (sent != n) {
        ttDbgPrint("*** SendInput() failed: %u ***\n", ::GetLastError());
        return false;
    }
    return true;
}

bool SendInputInjector::moveAbsolute(int x, int y)
{
    // http://msdn.microsoft.com/en-us/library/ms646260(VS.85).aspx
    // If MOUSEEVENTF_ABSOLUTE value is specified, dx and dy contain normalized absolute coordinates between 0 and 65,535.
    // Coordinate (0,0) maps onto the upper-left corner of the virtual desktop, (65535,65535) maps onto the lower-right corner.
    int vx = ::GetSystemMetrics(SM_XVIRTUALSCREEN);
    int vy = ::GetSystemMetrics(SM_YVIRTUALSCREEN);
    int vw = std::max(::GetSystemMetrics(SM_CXVIRTUALSCREEN) - 1, 1);
    int vh = std::max(::GetSystemMetrics(SM_CYVIRTUALSCREEN) - 1, 1);

    INPUT input{};
    input.type = INPUT_MOUSE;
    input.mi.dx = (LONG)std::llround(double(x - vx) * 65535.0 / vw);
    input.mi.dy = (LONG)std::llround(double(y - vy) * 65535.0 / vh);
    input.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_VIRTUALDESK;
    return send(&input, 1);
}

bool SendInputInjector::moveRelative(int dx, int dy)
{
    // relative MOUSEEVENTF_MOVE is subject to pointer acceleration. move to the computed position instead.
    POINT pos;
    if (!::GetCursorPos(&pos))
        return false;
    return moveAbsolute(pos.x + dx, pos.y + dy);
}

bool SendInputInjector::sendButton(int button, bool down)
{
    INPUT input{};
    input.type = INPUT_MOUSE;
    switch (button) {
    case 1: input.mi.dwFlags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP; break;
    case 2: input.mi.dwFlags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP; break;
    case 3: input.mi.dwFlags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP; break;
    case 4:
    case 5:
        input.mi.dwFlags = down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP;
        input.mi.mouseData = button == 4 ? XBUTTON1 : XBUTTON2;
        break;
    default:
        return false;
    }
    return send(&input, 1);
}

bool SendInputInjector::buttonDown(int button)
{
    return sendButton(button, true);
}

bool SendInputInjector::buttonUp(int button)
{
    return sendButton(button, false);
}

bool SendInputInjector::sendKey(KeyCode key, bool down)
{
    WORD vk = ToVirtualKey(key);
    if (vk == 0)
        return false;

    INPUT input{};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = vk;
    if (!down)
        input.ki.dwFlags |= KEYEVENTF_KEYUP;
    return send(&input, 1);
}

bool SendInputInjector::keyDown(KeyCode key)
{
    return sendKey(key, true);
}

bool SendInputInjector::keyUp(KeyCode key)
{
    return sendKey(key, false);
}

bool SendInputInjector::typeCharacter(char32_t c)
{
    // KEYEVENTF_UNICODE takes UTF-16 code units
    WORD units[2];
    int n = 0;
    if (c >= 0x10000) {
        c -= 0x10000;
        units[n++] = (WORD)(0xd800 + (c >> 10));
        units[n++] = (WORD)(0xdc00 + (c & 0x3ff));
    }
    else {
        units[n++] = (WORD)c;
    }

    INPUT inputs[4]{};
    UINT ni = 0;
    for (int i = 0; i < n; ++i) {
        inputs[ni].type = INPUT_KEYBOARD;
        inputs[ni].ki.wScan = units[i];
        inputs[ni].ki.dwFlags = KEYEVENTF_UNICODE;
        ++ni;
    }
    for (int i = 0; i < n; ++i) {
        inputs[ni].type = INPUT_KEYBOARD;
        inputs[ni].ki.wScan = units[i];
        inputs[ni].ki.dwFlags = KEYEVENTF_UNICODE | KEYEVENTF_KEYUP;
        ++ni;
    }
    return send(inputs, ni);
}

bool SendInputInjector::getMousePos(int2& dst)
{
    POINT pos;
    if (!::GetCursorPos(&pos))
        return false;
    dst = { (int)pos.x, (int)pos.y };
    return true;
}

IInjector* CreateSendInputInjector_()
{
    return new SendInputInjector();
}

} // namespace tt
#endif // _WIN32
