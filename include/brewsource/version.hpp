#pragma once

namespace brewsource
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

constexpr const char* VERSION_STRING = "1.0.0";

} // namespace brewsource
