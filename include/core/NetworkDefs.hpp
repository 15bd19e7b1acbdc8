#pragma once

// POSIX socket layer used by the bridge transport

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>

typedef int socket_t;
#define CLOSE_SOCKET(s) ::close(s)
#define IS_VALID_SOCKET(s) ((s) >= 0)
#ifndef INVALID_SOCKET
    #define INVALID_SOCKET (-1)
#endif

#define SOCK_BUF_TYPE void*

// Writing to a peer that vanished must surface as EPIPE, not kill the process
inline void init_network() {
    signal(SIGPIPE, SIG_IGN);
}

inline void cleanup_network() {}
