#include "pch.h"
#include "ttInternal.h"

namespace tt {

bool SplitLine(std::string_view line, std::string_view& timestamp, std::string_view& actions)
{
    auto pos = line.find('>');
    if (pos == std::string_view::npos)
        return false;
    timestamp = Trim(line.substr(0, pos));
    actions = line.substr(pos + 1);
    return true;
}

bool ParseTimestamp(std::string_view token, Timestamp& dst)
{
    token = Trim(token);

    bool relative = false;
    if (!token.empty() && token.front() == '+') {
        relative = true;
        token.remove_prefix(1);
    }

    // digits only. ToInt() would also take a sign.
    if (token.empty() || !std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return false;

    int64_t v;
    if (!ToInt(token, v))
        return false; // overflow

    dst.relative = relative;
    dst.value = (millisec)v;
    return true;
}

// resolution follows source order, not the order events end up in the timeline.
millisec TimestampResolver::resolve(const Timestamp& ts)
{
    m_last = ts.relative ? m_last + ts.value : ts.value;
    return m_last;
}

millisec TimestampResolver::last() const
{
    return m_last;
}

} // namespace tt
