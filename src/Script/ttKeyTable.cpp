#include "pch.h"
#include "ttInternal.h"

namespace tt {

Platform GetPlatform()
{
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

const char* ToString(Platform v)
{
    switch (v) {
    case Platform::Windows: return "Windows";
    case Platform::Linux: return "Linux";
    case Platform::MacOS: return "macOS";
    default: return "";
    }
}

namespace {

struct Capability
{
    Platform platform;
    Feature feature;
    bool supported;
};

// anything not listed here is supported
const Capability g_capabilities[] =
{
    { Platform::MacOS, Feature::MouseButton4, false },
    { Platform::MacOS, Feature::MouseButton5, false },
    { Platform::MacOS, Feature::KeyInsert, false },
};

#define K(Name, Code) { Name, KeyCode::Code, Feature::None }
#define C(Char) { #Char, (KeyCode)#Char[0], Feature::None }

const KeyInfo g_keys[] =
{
    C(a), C(b), C(c), C(d), C(e), C(f), C(g), C(h), C(i), C(j), C(k), C(l), C(m),
    C(n), C(o), C(p), C(q), C(r), C(s), C(t), C(u), C(v), C(w), C(x), C(y), C(z),
    C(0), C(1), C(2), C(3), C(4), C(5), C(6), C(7), C(8), C(9),

    { "`", (KeyCode)'`', Feature::None },
    { "-", (KeyCode)'-', Feature::None },
    { "=", (KeyCode)'=', Feature::None },
    { "[", (KeyCode)'[', Feature::None },
    { "]", (KeyCode)']', Feature::None },
    { "\\", (KeyCode)'\\', Feature::None },
    { ";", (KeyCode)';', Feature::None },
    { "semicolon", (KeyCode)';', Feature::None }, // ';' itself separates actions
    { "'", (KeyCode)'\'', Feature::None },
    { ",", (KeyCode)',', Feature::None },
    { ".", (KeyCode)'.', Feature::None },
    { "/", (KeyCode)'/', Feature::None },

    K("backspace", Backspace),
    K("tab", Tab),
    K("enter", Enter),
    K("escape", Escape),
    K("space", Space),
    K("delete", Delete),
    { "insert", KeyCode::Insert, Feature::KeyInsert },
    K("home", Home),
    K("end", End),
    K("pageup", PageUp),
    K("pagedown", PageDown),
    K("left", Left),
    K("right", Right),
    K("up", Up),
    K("down", Down),

    K("shift", Shift),
    K("control", Control),
    K("alt", Alt),
    K("super", Super),
    K("capslock", CapsLock),

    K("f1", F1), K("f2", F2), K("f3", F3), K("f4", F4), K("f5", F5),
    K("f6", F6), K("f7", F7), K("f8", F8), K("f9", F9), K("f10", F10),
    K("f11", F11), K("f12", F12), K("f13", F13), K("f14", F14), K("f15", F15),
    K("f16", F16), K("f17", F17), K("f18", F18), K("f19", F19), K("f20", F20),
};

#undef C
#undef K

} // namespace

bool IsSupported(Platform platform, Feature feature)
{
    if (feature == Feature::None)
        return true;
    for (auto& c : g_capabilities) {
        if (c.platform == platform && c.feature == feature)
            return c.supported;
    }
    return true;
}

std::span<const KeyInfo> GetKeyTable()
{
    return g_keys;
}

const KeyInfo* FindKey(std::string_view name)
{
    auto lname = ToLower(name);
    for (auto& k : g_keys) {
        if (lname == k.name)
            return &k;
    }
    return nullptr;
}

const KeyInfo* FindKey(KeyCode code)
{
    for (auto& k : g_keys) {
        if (k.code == code)
            return &k;
    }
    return nullptr;
}

std::string ToString(KeyCode v)
{
    if (auto* k = FindKey(v))
        return k->name;
    return Format("0x%x", (int)v);
}

} // namespace tt
