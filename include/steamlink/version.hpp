#ifndef STEAMLINK_VERSION_HPP
#define STEAMLINK_VERSION_HPP

#include <string>

namespace steamlink {

const std::string STEAMLINK_VERSION_STRING = "1.2.0";
const int STEAMLINK_VERSION_MAJOR = 1;
const int STEAMLINK_VERSION_MINOR = 2;
const int STEAMLINK_VERSION_PATCH = 0;

} // namespace steamlink

#endif // STEAMLINK_VERSION_HPP
