#include "pch.h"
#include "ttInternal.h"

namespace tt {

const char* ToString(ErrorCode v)
{
    switch (v) {
    case ErrorCode::None: return "None";
    case ErrorCode::MissingSeparator: return "MissingSeparator";
    case ErrorCode::InvalidTimestamp: return "InvalidTimestamp";
    case ErrorCode::MissingAction: return "MissingAction";
    case ErrorCode::UnknownActionVerb: return "UnknownActionVerb";
    case ErrorCode::InvalidArgumentCount: return "InvalidArgumentCount";
    case ErrorCode::InvalidArgumentValue: return "InvalidArgumentValue";
    case ErrorCode::UnsupportedOnPlatform: return "UnsupportedOnPlatform";
    case ErrorCode::UnterminatedComment: return "UnterminatedComment";
    default: return "";
    }
}

std::string Diagnostic::toText() const
{
    return Format("Line %d: %s", line, message.c_str());
}

Timeline BuildTimeline(const std::vector<ScriptLine>& lines)
{
    Timeline ret;
    uint32_t seq = 0;
    for (auto& line : lines) {
        for (auto& action : line.actions)
            ret.push_back({ line.time, action, seq++ });
    }
    std::stable_sort(ret.begin(), ret.end(), [](const TimelineEvent& a, const TimelineEvent& b) {
        return a.time < b.time || (a.time == b.time && a.seq < b.seq);
        });
    return ret;
}

Script Compile(std::string_view source, Platform platform)
{
    ttProfile("Compile");

    Script ret;
    ret.platform = platform;

    std::vector<ScriptLine> lines;
    TimestampResolver resolver;
    for (auto& src : Lex(source, &ret.warnings)) {
        ScriptLine line;
        line.number = src.number;

        std::string_view ts_text, actions_text;
        if (!SplitLine(src.text, ts_text, actions_text)) {
            ret.errors.push_back({ src.number, ErrorCode::MissingSeparator,
                Format("incorrectly formatted line, missing '>': %s", src.text.c_str()) });
            continue;
        }

        Timestamp ts;
        if (!ParseTimestamp(ts_text, ts)) {
            ret.errors.push_back({ src.number, ErrorCode::InvalidTimestamp,
                Format("incorrectly formatted timestamp \"%s\"", std::string(ts_text).c_str()) });
        }
        else if (ts.value > MaxTime || (ts.relative && ts.value > MaxTime - resolver.last())) {
            ret.errors.push_back({ src.number, ErrorCode::InvalidTimestamp,
                Format("timestamp \"%s\" is out of range (max. %llums)", std::string(ts_text).c_str(), (unsigned long long)MaxTime) });
        }
        else {
            line.time = resolver.resolve(ts);
        }

        // actions are checked even if the timestamp is broken so that every problem is reported at once
        ParseActions(actions_text, src.number, platform, line.actions, ret.errors);
        lines.push_back(std::move(line));
    }

    if (ret.errors.empty())
        ret.timeline = BuildTimeline(lines);
    ttDbgPrint("compiled %d lines, %d events, %d errors\n", (int)lines.size(), (int)ret.timeline.size(), (int)ret.errors.size());
    return ret;
}

bool LoadScript(const char* path, Script& dst, std::string* error)
{
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) {
        if (error)
            *error = Format("couldn't open %s", path);
        return false;
    }

    std::string source((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    // skip UTF-8 BOM
    if (source.size() >= 3 && source.compare(0, 3, "\xEF\xBB\xBF") == 0)
        source.erase(0, 3);

    dst = Compile(source);
    return true;
}

} // namespace tt
