#include "pch.h"
#include "ttInternal.h"

namespace tt {

std::string FormatImpl(const char* format, va_list args)
{
    const int MaxBuf = 4096;
    char buf[MaxBuf];
    vsnprintf(buf, MaxBuf, format, args);
    return buf;
}

std::string Format(const char* format, ...)
{
    std::string ret;
    va_list args;
    va_start(args, format);
    ret = FormatImpl(format, args);
    va_end(args);
    return ret;
}

void Print(const char* fmt, ...)
{
    char buf[1024 * 2];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, std::size(buf), fmt, args);
    va_end(args);

#ifdef _WIN32
    ::OutputDebugStringA(buf);
#endif
    fputs(buf, stdout);
    fflush(stdout);
}

millisec NowMS()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

nanosec NowNS()
{
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

void SleepMS(millisec v)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(v));
}

void Split(const std::string& str, const std::string& separator, const std::function<void(std::string sub)>& body)
{
    size_t offset = 0;
    for (;;) {
        size_t pos = str.find(separator, offset);
        body(str.substr(offset, pos - offset));
        if (pos == std::string::npos)
            break;
        else
            offset = pos + separator.size();
    }
}

static inline bool IsBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string_view Trim(std::string_view str)
{
    while (!str.empty() && IsBlank(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && IsBlank(str.back()))
        str.remove_suffix(1);
    return str;
}

std::string ToLower(std::string_view str)
{
    std::string ret(str);
    for (char& c : ret)
        c = (char)std::tolower((unsigned char)c);
    return ret;
}

bool ToInt(std::string_view str, int64_t& dst)
{
    if (str.empty())
        return false;
    auto* first = str.data();
    auto* last = str.data() + str.size();
    auto r = std::from_chars(first, last, dst);
    return r.ec == std::errc() && r.ptr == last;
}

std::u32string ToUTF32(std::string_view str)
{
    std::u32string ret;
    ret.reserve(str.size());

    size_t i = 0;
    while (i < str.size()) {
        auto c = (unsigned char)str[i];
        int len = 0;
        char32_t cp = 0;
        if (c < 0x80) { len = 1; cp = c; }
        else if ((c & 0xe0) == 0xc0) { len = 2; cp = c & 0x1f; }
        else if ((c & 0xf0) == 0xe0) { len = 3; cp = c & 0x0f; }
        else if ((c & 0xf8) == 0xf0) { len = 4; cp = c & 0x07; }

        bool ok = len > 0 && i + len <= str.size();
        for (int j = 1; ok && j < len; ++j) {
            auto cc = (unsigned char)str[i + j];
            if ((cc & 0xc0) != 0x80)
                ok = false;
            else
                cp = (cp << 6) | (cc & 0x3f);
        }

        if (ok) {
            ret.push_back(cp);
            i += len;
        }
        else {
            ret.push_back(c);
            ++i;
        }
    }
    return ret;
}


Timer::Timer()
{
    reset();
}

void Timer::reset()
{
    m_begin = NowNS();
}

float Timer::elapsed() const
{
    return float((NowNS() - m_begin) / 1000000000.0);
}


ProfileTimer::ProfileTimer(const char* mes, ...)
{
    va_list args;
    va_start(args, mes);
    m_message = FormatImpl(mes, args);
    va_end(args);
}

ProfileTimer::~ProfileTimer()
{
    float t = elapsed() * 1000.0f;
    Print("%s - %.2fms\n", m_message.c_str(), t);
}

} // namespace tt
