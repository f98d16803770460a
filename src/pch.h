#pragma once

#include <cstdio>
#include <cstdint>
#include <cstdarg>
#include <cstring>
#include <cctype>
#include <cmath>
#include <csignal>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <map>
#include <algorithm>
#include <functional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <charconv>
#include <system_error>
#include <type_traits>
#include <span>

#ifdef _WIN32
    #define NOMINMAX
    #include <windows.h>
#endif
