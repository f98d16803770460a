#include "pch.h"
#include "Test.h"
#include "ttInternal.h"

using tt::KeyCode;
using tt::PlayState;

namespace {

// records every call. a call whose text equals fail_on returns false.
class MockInjector : public tt::RefCount<tt::IInjector>
{
public:
    std::vector<std::string> calls;
    std::string fail_on;
    bool has_pos = false;
    tt::int2 pos{};

    bool moveAbsolute(int x, int y) override { return record(tt::Format("moveAbsolute %d %d", x, y)); }
    bool moveRelative(int dx, int dy) override { return record(tt::Format("moveRelative %d %d", dx, dy)); }
    bool buttonDown(int button) override { return record(tt::Format("buttonDown %d", button)); }
    bool buttonUp(int button) override { return record(tt::Format("buttonUp %d", button)); }
    bool keyDown(KeyCode key) override { return record("keyDown " + tt::ToString(key)); }
    bool keyUp(KeyCode key) override { return record("keyUp " + tt::ToString(key)); }
    bool typeCharacter(char32_t c) override { return record(tt::Format("type %X", (unsigned)c)); }
    bool getMousePos(tt::int2& dst) override
    {
        if (!has_pos)
            return false;
        dst = pos;
        return true;
    }

    int count(const char* prefix) const
    {
        return (int)std::count_if(calls.begin(), calls.end(), [&](const std::string& c) { return c.rfind(prefix, 0) == 0; });
    }

private:
    bool record(std::string call)
    {
        bool ok = call != fail_on;
        calls.push_back(std::move(call));
        return ok;
    }
};
using MockInjectorPtr = tt::ref_ptr<MockInjector>;

PlayState Play(MockInjectorPtr injector, const char* source, tt::PlayerSettings settings = {})
{
    auto script = tt::Compile(source);
    Expect(script.valid());

    auto player = tt::CreatePlayer(injector.get(), settings);
    Expect(player->start(script));
    auto ret = player->wait();
    Expect(player->getDeviceState().empty());
    return ret;
}

bool SameCalls(const MockInjector& injector, const std::vector<std::string>& expected)
{
    if (injector.calls != expected) {
        for (auto& c : injector.calls)
            testPrint("    %s\n", c.c_str());
        return false;
    }
    return true;
}

} // namespace


TestCase(Player_Basic)
{
    auto injector = tt::make_ref<MockInjector>();
    auto state = Play(injector,
        "0>mousemove abs 10 10\n"
        "100>keydown a;keyup a\n"
        "+50>release key\n");
    Expect(state == PlayState::Completed);
    // release at 150 has nothing left to release
    Expect(SameCalls(*injector, { "moveAbsolute 10 10", "keyDown a", "keyUp a" }));
}

TestCase(Player_Timing)
{
    auto injector = tt::make_ref<MockInjector>();
    tt::Timer timer;
    test::TestScope("out of order lines", [&]() {
        auto state = Play(injector,
            "60>keydown b\n"
            "30>keydown a\n"
            "+0>release both\n");
        Expect(state == PlayState::Completed);
    });
    Expect(timer.elapsed() >= 0.059f);
    Expect(SameCalls(*injector, { "keyDown a", "keyUp a", "keyDown b", "keyUp b" }));
}

TestCase(Player_InterpolateRelative)
{
    auto injector = tt::make_ref<MockInjector>();
    tt::PlayerSettings settings;
    settings.tick_interval = 16;

    tt::Timer timer;
    auto state = Play(injector, "0>mousemove rel 0 570 200", settings);
    Expect(state == PlayState::Completed);
    Expect(timer.elapsed() >= 0.199f);

    Expect(injector->calls.size() == 13);
    int sx = 0, sy = 0;
    for (auto& c : injector->calls) {
        int dx, dy;
        Expect(sscanf(c.c_str(), "moveRelative %d %d", &dx, &dy) == 2);
        sx += dx;
        sy += dy;
    }
    Expect(sx == 0 && sy == 570);
}

TestCase(Player_InterpolateAbsolute)
{
    auto injector = tt::make_ref<MockInjector>();
    injector->has_pos = true;
    injector->pos = { 100, 100 };

    tt::PlayerSettings settings;
    settings.tick_interval = 16;
    auto state = Play(injector, "0>mousemove abs 200 300 50", settings);
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector, { "moveAbsolute 125 150", "moveAbsolute 150 200", "moveAbsolute 175 250", "moveAbsolute 200 300" }));

    // unknown start position: every step lands on the target
    auto injector2 = tt::make_ref<MockInjector>();
    state = Play(injector2, "0>mousemove abs 7 9 20", settings);
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector2, { "moveAbsolute 7 9", "moveAbsolute 7 9" }));

    // a later timed move starts where the previous one ended
    auto injector3 = tt::make_ref<MockInjector>();
    state = Play(injector3, "0>mousemove abs 0 0\n0>mousemove rel 10 0\n0>mousemove abs 30 0 32", settings);
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector3, { "moveAbsolute 0 0", "moveRelative 10 0", "moveAbsolute 20 0", "moveAbsolute 30 0" }));
}

TestCase(Player_Idempotence)
{
    auto injector = tt::make_ref<MockInjector>();
    auto state = Play(injector,
        "0>keydown a;keydown a;mousedown 1;mousedown 1\n"
        "10>keyup a;keyup a;mouseup 1;mouseup 1;mouseup 2;keyup b\n");
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector, { "keyDown a", "buttonDown 1", "keyUp a", "buttonUp 1" }));
}

TestCase(Player_Release)
{
    auto injector = tt::make_ref<MockInjector>();
    auto state = Play(injector, "0>release both\n10>release key\n20>release mouse\n");
    Expect(state == PlayState::Completed);
    Expect(injector->calls.empty());

    auto injector2 = tt::make_ref<MockInjector>();
    state = Play(injector2,
        "0>keydown a;keydown shift;mousedown 2\n"
        "10>release key\n"
        "20>release mouse\n"
        "30>keydown b\n"); // still held at the end, released when the run completes
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector2, {
        "keyDown a", "keyDown shift", "buttonDown 2",
        "keyUp a", "keyUp shift",
        "buttonUp 2",
        "keyDown b", "keyUp b" }));
}

TestCase(Player_Text)
{
    auto injector = tt::make_ref<MockInjector>();
    auto state = Play(injector, "0>text h\xC3\xA9 !;keydown a\n10>release key\n");
    Expect(state == PlayState::Completed);
    Expect(SameCalls(*injector, { "type 68", "type E9", "type 20", "type 21", "keyDown a", "keyUp a" }));
}

TestCase(Player_Cancel)
{
    auto injector = tt::make_ref<MockInjector>();
    auto script = tt::Compile("0>mousedown 1;keydown shift;mousemove rel 1000 0 2000\n3000>keydown a\n");
    Expect(script.valid());

    auto player = tt::CreatePlayer(injector.get());
    tt::Timer timer;
    Expect(player->start(script));
    Expect(!player->waitFor(50));
    Expect(player->getState() == PlayState::Running);
    player->cancel();
    Expect(player->wait() == PlayState::Cancelled);
    Expect(timer.elapsed() < 1.0f);

    Expect(player->getDeviceState().empty());
    Expect(injector->count("moveRelative") < 125);
    Expect(injector->count("keyDown a") == 0);
    Expect(injector->count("keyUp shift") == 1);
    Expect(injector->count("buttonUp 1") == 1);

    // terminal
    Expect(!player->start(script));
    Expect(player->getState() == PlayState::Cancelled);

    // cancelling before start makes the player unusable too
    auto player2 = tt::CreatePlayer(injector.get());
    player2->cancel();
    Expect(!player2->start(script));
    Expect(player2->wait() == PlayState::Cancelled);
}

TestCase(Player_LongTimes)
{
    test::TestScope("event at the upper bound", [&]() {
        auto injector = tt::make_ref<MockInjector>();
        auto script = tt::Compile(tt::Format("%llu>keydown a", (unsigned long long)tt::MaxTime));
        Expect(script.valid());

        auto player = tt::CreatePlayer(injector.get());
        Expect(player->start(script));
        Expect(!player->waitFor(200));
        player->cancel();
        auto state = player->wait();
        Expect(tt::IsTerminal(state) && state == PlayState::Cancelled);
        Expect(injector->calls.empty());
    });

    test::TestScope("long timed move", [&]() {
        auto injector = tt::make_ref<MockInjector>();
        auto script = tt::Compile("0>mousemove rel 0 1000 2147483647");
        Expect(script.valid());

        tt::PlayerSettings settings;
        settings.tick_interval = 16;
        auto player = tt::CreatePlayer(injector.get(), settings);
        Expect(player->start(script));
        tt::SleepMS(100);
        player->cancel();
        Expect(player->wait() == PlayState::Cancelled);
        // one step per tick, not every step at once
        Expect(injector->count("moveRelative") <= 10);
    });

    test::TestScope("far apart absolute move", [&]() {
        auto injector = tt::make_ref<MockInjector>();
        injector->has_pos = true;
        injector->pos = { -1000, 0 };

        tt::PlayerSettings settings;
        settings.tick_interval = 16;
        auto state = Play(injector, "0>mousemove abs 2147483000 0 32", settings);
        Expect(state == PlayState::Completed);
        Expect(SameCalls(*injector, { "moveAbsolute 1073741000 0", "moveAbsolute 2147483000 0" }));
    });
}

TestCase(Player_DeviceError)
{
    auto injector = tt::make_ref<MockInjector>();
    injector->fail_on = "keyDown b";
    auto state = Play(injector,
        "0>keydown a;mousedown 3\n"
        "10>keydown b\n"
        "20>keydown c\n");
    Expect(state == PlayState::Failed);
    Expect(SameCalls(*injector, { "keyDown a", "buttonDown 3", "keyDown b", "keyUp a", "buttonUp 3" }));

    auto injector2 = tt::make_ref<MockInjector>();
    injector2->fail_on = "moveRelative 0 5";
    auto script = tt::Compile("0>mousemove rel 0 10 20");
    tt::PlayerSettings settings;
    settings.tick_interval = 10;
    auto player = tt::CreatePlayer(injector2.get(), settings);
    Expect(player->start(script));
    Expect(player->wait() == PlayState::Failed);
    Expect(player->getError().find("moveRelative(0, 5)") != std::string::npos);
    Expect(injector2->calls.size() == 1);
}

TestCase(Player_RejectsInvalidScript)
{
    auto injector = tt::make_ref<MockInjector>();
    auto script = tt::Compile("0>keydown a\nabc>keydown xyz\n");
    Expect(!script.valid());

    auto player = tt::CreatePlayer(injector.get());
    Expect(!player->start(script));
    Expect(player->getState() == PlayState::Idle);
    Expect(injector->calls.empty());
}
