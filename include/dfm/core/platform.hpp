#pragma once

#ifdef _WIN32
    #define DFM_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define DFM_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <unistd.h>
#endif

namespace dfm {

enum class Platform {
    Windows,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef DFM_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(DFM_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

} // namespace dfm
