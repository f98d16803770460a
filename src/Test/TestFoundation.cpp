#include "pch.h"
#include "Test.h"
#include "ttInternal.h"

TestCase(Foundation_String)
{
    std::vector<std::string> parts;
    tt::Split("keydown a;keyup a;;text x", ";", [&](std::string s) { parts.push_back(s); });
    Expect(parts.size() == 4);
    Expect(parts[0] == "keydown a" && parts[2].empty() && parts[3] == "text x");

    Expect(tt::Trim("  \t100 \r") == "100");
    Expect(tt::Trim("   ").empty());
    Expect(tt::ToLower("F12") == "f12");
}

TestCase(Foundation_ToInt)
{
    int64_t v = 0;
    Expect(tt::ToInt("570", v) && v == 570);
    Expect(tt::ToInt("-42", v) && v == -42);
    Expect(!tt::ToInt("", v));
    Expect(!tt::ToInt("12a", v));
    Expect(!tt::ToInt(" 1", v));
    Expect(!tt::ToInt("+1", v));
    Expect(!tt::ToInt("99999999999999999999", v));
}

TestCase(Foundation_UTF8)
{
    auto s = tt::ToUTF32("a\xC3\xA9\xE3\x81\x82\xF0\x9F\x98\x80");
    Expect(s.size() == 4);
    Expect(s[0] == U'a' && s[1] == 0xe9 && s[2] == 0x3042 && s[3] == 0x1f600);

    // a broken sequence still yields one character per byte
    auto b = tt::ToUTF32("\xC3x");
    Expect(b.size() == 2 && b[1] == U'x');
}

namespace {
struct Counted : public tt::RefCount<tt::IObject>
{
    static inline int s_alive = 0;
    Counted() { ++s_alive; }
    ~Counted() override { --s_alive; }
};
} // namespace

TestCase(Foundation_RefPtr)
{
    {
        auto a = tt::make_ref<Counted>();
        Expect(a->getRef() == 1);
        {
            auto b = a;
            Expect(a->getRef() == 2);
            b = a;
            Expect(a->getRef() == 2);
        }
        Expect(a->getRef() == 1);

        tt::ref_ptr<Counted> c(std::move(a));
        Expect(!a && c && c->getRef() == 1);
        Expect(Counted::s_alive == 1);
    }
    Expect(Counted::s_alive == 0);
}
