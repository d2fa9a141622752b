/*
 * sandfs C++ - JSON type
 *
 * All configuration, tool parameters and tool results use nlohmann::json.
 */
#ifndef sandfs_CORE_JSON_HPP
#define sandfs_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sandfs {

typedef nlohmann::json Json;

} // namespace sandfs

#endif // sandfs_CORE_JSON_HPP
