#pragma once
#include <vector>
#include <chrono>
#include <span>
#include "ttFoundation.h"

namespace tt {

enum class Platform : int
{
    Windows,
    Linux,
    MacOS,
};

// entries of the input tables that are not available everywhere
enum class Feature : int
{
    None,
    MouseButton4,
    MouseButton5,
    KeyInsert,
};

ttAPI Platform GetPlatform();
ttAPI const char* ToString(Platform v);
ttAPI bool IsSupported(Platform platform, Feature feature);


// printable keys use their (lower case) ASCII code.
enum class KeyCode : int
{
    Unknown = 0,

    Backspace = 0x100,
    Tab,
    Enter,
    Escape,
    Space,
    Delete,
    Insert,
    Home,
    End,
    PageUp,
    PageDown,
    Left,
    Right,
    Up,
    Down,

    Shift,
    Control,
    Alt,
    Super,
    CapsLock,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10,
    F11, F12, F13, F14, F15, F16, F17, F18, F19, F20,
};

struct KeyInfo
{
    const char* name;
    KeyCode code;
    Feature feature;
};
ttAPI std::span<const KeyInfo> GetKeyTable();
ttAPI const KeyInfo* FindKey(std::string_view name);
ttAPI const KeyInfo* FindKey(KeyCode code);
ttAPI std::string ToString(KeyCode v);


enum class ActionType : int
{
    Unknown,
    MouseMoveAbs,
    MouseMoveRel,
    MouseDown,
    MouseUp,
    KeyDown,
    KeyUp,
    Release,
    Text,
};

enum class ReleaseTarget : int
{
    Mouse = 1,
    Key = 2,
    Both = Mouse | Key,
};

struct Action
{
    ActionType type = ActionType::Unknown;
    union
    {
        struct
        {
            int x, y;
            millisec duration;
        } move;
        struct
        {
            int button;
        } mouse;
        struct
        {
            KeyCode code;
        } key;
        struct
        {
            ReleaseTarget target;
        } release;
    } data{};
    std::string text;

    std::string toText() const;
    bool operator==(const Action& v) const;
    bool operator!=(const Action& v) const { return !(*this == v); }

    static Action MouseMove(bool relative, int x, int y, millisec duration = 0);
    static Action MouseButton(bool down, int button);
    static Action Key(bool down, KeyCode code);
    static Action Release(ReleaseTarget target);
    static Action Text(std::string v);
};


enum class ErrorCode : int
{
    None,

    // syntax
    MissingSeparator,
    InvalidTimestamp,
    MissingAction,

    UnknownActionVerb,
    InvalidArgumentCount,
    InvalidArgumentValue,
    UnsupportedOnPlatform,

    // warnings
    UnterminatedComment,
};
ttAPI const char* ToString(ErrorCode v);
inline bool IsSyntaxError(ErrorCode v) { return v >= ErrorCode::MissingSeparator && v <= ErrorCode::MissingAction; }

struct Diagnostic
{
    int line = 0;
    ErrorCode code = ErrorCode::None;
    std::string message;

    std::string toText() const;
};
using Diagnostics = std::vector<Diagnostic>;


struct SourceLine
{
    int number = 0;     // 1-based
    std::string text;
};

// upper bound of resolved times and mousemove durations.
// due times are steady_clock time points, time + duration must stay far from the clock's limit.
constexpr millisec MaxTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::duration::max()).count() / 4;

struct Timestamp
{
    bool relative = false;
    millisec value = 0;
};

class TimestampResolver
{
public:
    millisec resolve(const Timestamp& ts);
    millisec last() const;

private:
    millisec m_last = 0;
};

struct ScriptLine
{
    int number = 0;
    millisec time = 0;
    std::vector<Action> actions;
};

struct TimelineEvent
{
    millisec time = 0;
    Action action;
    uint32_t seq = 0;
};
using Timeline = std::vector<TimelineEvent>;

struct Script
{
    Platform platform = Platform::Windows;
    Timeline timeline; // empty unless errors is empty
    Diagnostics errors;
    Diagnostics warnings;

    bool valid() const { return errors.empty(); }
};


// lexer
ttAPI std::string StripComments(std::string_view source, Diagnostics* warnings = nullptr);
ttAPI std::vector<SourceLine> Lex(std::string_view source, Diagnostics* warnings = nullptr);

// "<timestamp>><actions>"
ttAPI bool SplitLine(std::string_view line, std::string_view& timestamp, std::string_view& actions);
ttAPI bool ParseTimestamp(std::string_view token, Timestamp& dst);

// appends parsed actions to dst and problems to errors. returns true if no error was found.
ttAPI bool ParseActions(std::string_view src, int line, Platform platform, std::vector<Action>& dst, Diagnostics& errors);

ttAPI Timeline BuildTimeline(const std::vector<ScriptLine>& lines);

ttAPI Script Compile(std::string_view source, Platform platform = GetPlatform());
ttAPI bool LoadScript(const char* path, Script& dst, std::string* error = nullptr);

} // namespace tt
