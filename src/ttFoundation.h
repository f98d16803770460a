#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include "ttRefPtr.h"

#define ttAPI

#define ttDeclPtr(T)\
    class T;\
    using T##Ptr = ref_ptr<T>;

#define ttDefShared(F)\
    template<class... A>\
    inline auto F(A&&... a)\
    {\
        using T = std::remove_pointer_t<decltype(F##_(std::forward<A>(a)...))>;\
        return ref_ptr<T>(F##_(std::forward<A>(a)...));\
    }


#ifdef ttDebug
    #define ttEnableProfile
    #define ttDbgPrint(...) ::tt::Print(__VA_ARGS__)
#else
    //#define ttEnableProfile
    #define ttDbgPrint(...)
#endif

#ifdef ttEnableProfile
    #define ttProfile(...) ::tt::ProfileTimer _dbg_pftimer(__VA_ARGS__)
#else
    #define ttProfile(...)
#endif

namespace tt {

using millisec = uint64_t;
using nanosec = uint64_t;

struct int2
{
    int x, y;

    int2 operator+(const int2& v) const { return { x + v.x, y + v.y }; }
    int2 operator-(const int2& v) const { return { x - v.x, y - v.y }; }
    int2& operator+=(const int2& v) { x += v.x; y += v.y; return *this; }
    bool operator==(const int2& v) const { return x == v.x && y == v.y; }
    bool operator!=(const int2& v) const { return !(*this == v); }
};

std::string Format(const char* format, ...);
void Print(const char* fmt, ...);
millisec NowMS();
nanosec NowNS();
void SleepMS(millisec v);

void Split(const std::string& str, const std::string& separator, const std::function<void(std::string sub)>& body);
std::string_view Trim(std::string_view str);
std::string ToLower(std::string_view str);
// accepts decimal digits with an optional leading '-'. no whitespace, no '+'.
bool ToInt(std::string_view str, int64_t& dst);

// decodes UTF-8. invalid sequences are passed through one byte per character.
std::u32string ToUTF32(std::string_view str);

class IObject
{
public:
    virtual int addRef() = 0;
    virtual int release() = 0;
    virtual int getRef() const = 0;

protected:
    virtual ~IObject() {}
};

} // namespace tt
