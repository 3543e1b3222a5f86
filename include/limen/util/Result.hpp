#pragma once
#include <Geode/Result.hpp>

namespace limen {

using geode::Ok;
using geode::Err;
using geode::Result;

}
