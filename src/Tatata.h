#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <functional>
#include <span>

#include "ttFoundation.h"
#include "ttScript.h"
#include "ttInput.h"
