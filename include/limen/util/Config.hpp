#pragma once

#define LIMEN_NODISCARD [[nodiscard]]
