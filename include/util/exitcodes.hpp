#pragma once

namespace exitc
{
inline constexpr int ok           = 0;
inline constexpr int bad_args     = 2;
inline constexpr int no_server    = 3;
inline constexpr int start_failed = 4;
}  // namespace exitc
