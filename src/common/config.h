#ifndef OVERLOOK_SRC_COMMON_CONFIG_H_
#define OVERLOOK_SRC_COMMON_CONFIG_H_

#include <cstdint>

namespace Overlook {

/// Resource names used in offers and launch descriptors
constexpr char kCpusResource[] = "cpus";
constexpr char kMemResource[] = "mem";
constexpr char kPortsResource[] = "ports";

/// Every viewer binds exactly one host port
constexpr uint32_t kRequiredPortCount = 1;

/// Port mapping protocol for the viewer's HTTP listener
constexpr char kPortProtocol[] = "tcp";

/// Environment variable carrying the allocated host port into the container
constexpr char kHostPortEnv[] = "PORT0";

/// Viewer flag selecting its listen port when it shares the host's network
constexpr char kListenPortFlag[] = "--port";

} // namespace Overlook

#endif // OVERLOOK_SRC_COMMON_CONFIG_H_
