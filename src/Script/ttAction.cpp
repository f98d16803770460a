#include "pch.h"
#include "ttInternal.h"

namespace tt {

Action Action::MouseMove(bool relative, int x, int y, millisec duration)
{
    Action ret;
    ret.type = relative ? ActionType::MouseMoveRel : ActionType::MouseMoveAbs;
    ret.data.move.x = x;
    ret.data.move.y = y;
    ret.data.move.duration = duration;
    return ret;
}

Action Action::MouseButton(bool down, int button)
{
    Action ret;
    ret.type = down ? ActionType::MouseDown : ActionType::MouseUp;
    ret.data.mouse.button = button;
    return ret;
}

Action Action::Key(bool down, KeyCode code)
{
    Action ret;
    ret.type = down ? ActionType::KeyDown : ActionType::KeyUp;
    ret.data.key.code = code;
    return ret;
}

Action Action::Release(ReleaseTarget target)
{
    Action ret;
    ret.type = ActionType::Release;
    ret.data.release.target = target;
    return ret;
}

Action Action::Text(std::string v)
{
    Action ret;
    ret.type = ActionType::Text;
    ret.text = std::move(v);
    return ret;
}

std::string Action::toText() const
{
    switch (type)
    {
    case ActionType::MouseMoveAbs:
        return Format("MouseMoveAbs %d %d %llu", data.move.x, data.move.y, (unsigned long long)data.move.duration);

    case ActionType::MouseMoveRel:
        return Format("MouseMoveRel %d %d %llu", data.move.x, data.move.y, (unsigned long long)data.move.duration);

    case ActionType::MouseDown:
        return Format("MouseDown %d", data.mouse.button);

    case ActionType::MouseUp:
        return Format("MouseUp %d", data.mouse.button);

    case ActionType::KeyDown:
        return "KeyDown " + ToString(data.key.code);

    case ActionType::KeyUp:
        return "KeyUp " + ToString(data.key.code);

    case ActionType::Release:
        switch (data.release.target) {
        case ReleaseTarget::Mouse: return "Release mouse";
        case ReleaseTarget::Key: return "Release key";
        default: return "Release both";
        }

    case ActionType::Text:
        return "Text \"" + text + "\"";

    default:
        return "";
    }
}

bool Action::operator==(const Action& v) const
{
    if (type != v.type)
        return false;

    switch (type)
    {
    case ActionType::MouseMoveAbs:
    case ActionType::MouseMoveRel:
        return data.move.x == v.data.move.x && data.move.y == v.data.move.y && data.move.duration == v.data.move.duration;
    case ActionType::MouseDown:
    case ActionType::MouseUp:
        return data.mouse.button == v.data.mouse.button;
    case ActionType::KeyDown:
    case ActionType::KeyUp:
        return data.key.code == v.data.key.code;
    case ActionType::Release:
        return data.release.target == v.data.release.target;
    case ActionType::Text:
        return text == v.text;
    default:
        return true;
    }
}


namespace {

class ActionParser
{
public:
    ActionParser(int line, Platform platform, std::vector<Action>& dst, Diagnostics& errors)
        : m_line(line), m_platform(platform), m_dst(dst), m_errors(errors)
    {
    }

    void parse(std::string_view clause);
    int numClauses() const { return m_num_clauses; }
    int numErrors() const { return m_num_errors; }

private:
    void error(ErrorCode code, std::string message)
    {
        m_errors.push_back({ m_line, code, std::move(message) });
        ++m_num_errors;
    }
    bool expectArgs(const std::string& verb, const std::vector<std::string>& args, size_t min_args, size_t max_args);
    bool parseInt(const std::string& verb, const char* what, const std::string& arg, bool allow_negative, int64_t& dst);

    void parseMouseMove(const std::string& verb, const std::vector<std::string>& args);
    void parseMouseButton(const std::string& verb, const std::vector<std::string>& args, bool down);
    void parseKey(const std::string& verb, const std::vector<std::string>& args, bool down);
    void parseRelease(const std::string& verb, const std::vector<std::string>& args);
    void parseText(const std::string& verb, std::string_view payload);

    int m_line;
    Platform m_platform;
    std::vector<Action>& m_dst;
    Diagnostics& m_errors;
    int m_num_clauses = 0;
    int m_num_errors = 0;
};

bool ActionParser::expectArgs(const std::string& verb, const std::vector<std::string>& args, size_t min_args, size_t max_args)
{
    if (args.size() < min_args) {
        error(ErrorCode::InvalidArgumentCount, Format("%s: too few arguments (%d given, min. %d)",
            verb.c_str(), (int)args.size(), (int)min_args));
        return false;
    }
    if (args.size() > max_args) {
        error(ErrorCode::InvalidArgumentCount, Format("%s: too many arguments (%d given, max. %d)",
            verb.c_str(), (int)args.size(), (int)max_args));
        return false;
    }
    return true;
}

bool ActionParser::parseInt(const std::string& verb, const char* what, const std::string& arg, bool allow_negative, int64_t& dst)
{
    int64_t v;
    if (!ToInt(arg, v) || v < INT32_MIN || v > INT32_MAX) {
        error(ErrorCode::InvalidArgumentValue, Format("%s: invalid %s \"%s\"", verb.c_str(), what, arg.c_str()));
        return false;
    }
    if (!allow_negative && v < 0) {
        error(ErrorCode::InvalidArgumentValue, Format("%s: %s must not be negative (%s)", verb.c_str(), what, arg.c_str()));
        return false;
    }
    dst = v;
    return true;
}

void ActionParser::parseMouseMove(const std::string& verb, const std::vector<std::string>& args)
{
    if (!expectArgs(verb, args, 3, 4))
        return;

    bool ok = true;
    bool relative = false;
    if (args[0] == "rel")
        relative = true;
    else if (args[0] != "abs") {
        error(ErrorCode::InvalidArgumentValue, Format("%s: invalid mode \"%s\" (abs or rel)", verb.c_str(), args[0].c_str()));
        ok = false;
    }

    int64_t x = 0, y = 0, duration = 0;
    ok &= parseInt(verb, "x position", args[1], relative, x);
    ok &= parseInt(verb, "y position", args[2], relative, y);
    if (args.size() == 4)
        ok &= parseInt(verb, "duration", args[3], false, duration);
    static_assert((millisec)INT32_MAX <= MaxTime);

    if (ok)
        m_dst.push_back(Action::MouseMove(relative, (int)x, (int)y, (millisec)duration));
}

void ActionParser::parseMouseButton(const std::string& verb, const std::vector<std::string>& args, bool down)
{
    if (!expectArgs(verb, args, 1, 1))
        return;

    int64_t button;
    if (!ToInt(args[0], button) || button < 1 || button > 5) {
        error(ErrorCode::InvalidArgumentValue, Format("%s: invalid button \"%s\" (1-5)", verb.c_str(), args[0].c_str()));
        return;
    }

    auto feature = button == 4 ? Feature::MouseButton4 : button == 5 ? Feature::MouseButton5 : Feature::None;
    if (!IsSupported(m_platform, feature)) {
        error(ErrorCode::UnsupportedOnPlatform, Format("%s: button %d is not supported on %s",
            verb.c_str(), (int)button, ToString(m_platform)));
        return;
    }
    m_dst.push_back(Action::MouseButton(down, (int)button));
}

void ActionParser::parseKey(const std::string& verb, const std::vector<std::string>& args, bool down)
{
    if (!expectArgs(verb, args, 1, 1))
        return;

    auto* key = FindKey(args[0]);
    if (!key) {
        error(ErrorCode::InvalidArgumentValue, Format("%s: invalid key \"%s\"", verb.c_str(), args[0].c_str()));
        return;
    }
    if (!IsSupported(m_platform, key->feature)) {
        error(ErrorCode::UnsupportedOnPlatform, Format("%s: key \"%s\" is not supported on %s",
            verb.c_str(), key->name, ToString(m_platform)));
        return;
    }
    m_dst.push_back(Action::Key(down, key->code));
}

void ActionParser::parseRelease(const std::string& verb, const std::vector<std::string>& args)
{
    if (!expectArgs(verb, args, 1, 1))
        return;

    if (args[0] == "mouse")
        m_dst.push_back(Action::Release(ReleaseTarget::Mouse));
    else if (args[0] == "key")
        m_dst.push_back(Action::Release(ReleaseTarget::Key));
    else if (args[0] == "both")
        m_dst.push_back(Action::Release(ReleaseTarget::Both));
    else
        error(ErrorCode::InvalidArgumentValue, Format("%s: invalid target \"%s\" (mouse, key or both)", verb.c_str(), args[0].c_str()));
}

void ActionParser::parseText(const std::string& verb, std::string_view payload)
{
    if (payload.empty()) {
        error(ErrorCode::InvalidArgumentCount, Format("%s: no text provided", verb.c_str()));
        return;
    }
    if (payload.find('>') != std::string_view::npos) {
        error(ErrorCode::InvalidArgumentValue, Format("%s: text must not contain '>'", verb.c_str()));
        return;
    }
    m_dst.push_back(Action::Text(std::string(payload)));
}

void ActionParser::parse(std::string_view clause)
{
    // leading blanks only. text keeps everything after the verb.
    while (!clause.empty() && (clause.front() == ' ' || clause.front() == '\t'))
        clause.remove_prefix(1);
    if (Trim(clause).empty())
        return;
    ++m_num_clauses;

    auto verb_end = std::min(clause.find_first_of(" \t"), clause.size());
    std::string verb(clause.substr(0, verb_end));
    auto rest = clause.substr(verb_end);

    if (verb == "text") {
        if (!rest.empty())
            rest.remove_prefix(1);
        if (!rest.empty() && rest.back() == '\r')
            rest.remove_suffix(1);
        parseText(verb, rest);
        return;
    }

    std::vector<std::string> args;
    {
        std::string_view s = rest;
        for (;;) {
            auto b = s.find_first_not_of(" \t\r\n");
            if (b == std::string_view::npos)
                break;
            s.remove_prefix(b);
            auto e = std::min(s.find_first_of(" \t\r\n"), s.size());
            args.emplace_back(s.substr(0, e));
            s.remove_prefix(e);
        }
    }

    if (verb == "mousemove")
        parseMouseMove(verb, args);
    else if (verb == "mousedown")
        parseMouseButton(verb, args, true);
    else if (verb == "mouseup")
        parseMouseButton(verb, args, false);
    else if (verb == "keydown")
        parseKey(verb, args, true);
    else if (verb == "keyup")
        parseKey(verb, args, false);
    else if (verb == "release")
        parseRelease(verb, args);
    else
        error(ErrorCode::UnknownActionVerb, Format("invalid action \"%s\"", verb.c_str()));
}

} // namespace


bool ParseActions(std::string_view src, int line, Platform platform, std::vector<Action>& dst, Diagnostics& errors)
{
    ActionParser parser(line, platform, dst, errors);
    Split(std::string(src), ";", [&](std::string clause) {
        parser.parse(clause);
        });

    if (parser.numClauses() == 0) {
        errors.push_back({ line, ErrorCode::MissingAction, "need at least one action" });
        return false;
    }
    return parser.numErrors() == 0;
}

} // namespace tt
