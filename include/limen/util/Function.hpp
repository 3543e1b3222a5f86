#pragma once
#include <std23/move_only_function.h>

namespace limen {

template <class Signature>
using MoveOnlyFunction = std23::move_only_function<Signature>;

}
