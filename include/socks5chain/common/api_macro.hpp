#pragma once

// Marks the public API for builds with -fvisibility=hidden.
#if defined(SOCKS5CHAIN_SHARED_LIB) && defined(__GNUC__)
#define SOCKS5CHAIN_API __attribute__((visibility("default")))
#else
#define SOCKS5CHAIN_API
#endif
