#ifndef ID_UTILS_H
#define ID_UTILS_H

#include <string>

/**
 * Random RFC 4122 version-4 UUID, lowercase hex with dashes.
 * Used for node ids (one per process) and transfer ids (one per send).
 */
std::string generate_uuid_v4();

#endif // ID_UTILS_H
