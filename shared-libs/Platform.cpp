#include "Platform.hpp"
#include "Errors.hpp"

#include <chrono>
#include <cstring>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <net/if.h>
#endif

#if defined(__linux__)
#include <linux/if_packet.h>
#include <net/if_arp.h>
#elif defined(__APPLE__)
#include <net/if_dl.h>
#endif

namespace unik {
    Timestamp SystemTimeSource::now() {
        const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch).count();
        return fromUnixNanos(static_cast<std::uint64_t>(nanos));
    }

    Timestamp SystemTimeSource::fromUnixNanos(std::uint64_t unixNanos) {
        return (unixNanos / 100 + GREGORIAN_OFFSET) & TIMESTAMP_MASK;
    }

    // TRUE se l'indirizzo è composto solo da zeri (interfaccia non configurata)
    static bool isZeroAddress(const unsigned char* address) {
        for (std::size_t i = 0; i < Node::LENGTH; ++i) {
            if (address[i] != 0) return false;
        }
        return true;
    }

    Node SystemNodeProvider::getNode() {
        if (mLoaded) return mNode;

#if defined(__linux__) || defined(__APPLE__)
        struct ifaddrs* ifap = nullptr;
        if (getifaddrs(&ifap) != 0) {
            throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "Unable to list network interfaces.");
        }

        bool found = false;
        for (struct ifaddrs* ifa = ifap; ifa != nullptr && !found; ifa = ifa->ifa_next) {
            if (ifa->ifa_addr == nullptr) continue;
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;

#if defined(__linux__)
            // su Linux gli indirizzi hardware sono nella famiglia AF_PACKET
            if (ifa->ifa_addr->sa_family != AF_PACKET) continue;
            const struct sockaddr_ll* sll = reinterpret_cast<const struct sockaddr_ll*>(ifa->ifa_addr);
            if (sll->sll_hatype != ARPHRD_ETHER || sll->sll_halen != Node::LENGTH) continue;
            const unsigned char* address = sll->sll_addr;
#else
            // su macOS/BSD nella famiglia AF_LINK
            if (ifa->ifa_addr->sa_family != AF_LINK) continue;
            const struct sockaddr_dl* sdl = reinterpret_cast<const struct sockaddr_dl*>(ifa->ifa_addr);
            if (sdl->sdl_alen != Node::LENGTH) continue;
            const unsigned char* address = reinterpret_cast<const unsigned char*>(LLADDR(sdl));
#endif
            if (isZeroAddress(address)) continue;

            std::memcpy(mNode.mBytes.data(), address, Node::LENGTH);
            found = true;
        }

        freeifaddrs(ifap);

        if (!found) {
            throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "No network interface with a hardware address was found.");
        }
        mLoaded = true;
        return mNode;
#else
        throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "Reading the hardware address is not supported on this platform.");
#endif
    }

    RandomNodeProvider::RandomNodeProvider(EntropySource& entropy) {
        entropy.fill(mNode.mBytes.data(), Node::LENGTH);
        mNode.mBytes[0] |= 0x01; // bit multicast
    }

#if defined(__unix__) || defined(__APPLE__)
    std::uint32_t PosixIdentityProvider::currentUserId() {
        return static_cast<std::uint32_t>(getuid());
    }

    std::uint32_t PosixIdentityProvider::currentGroupId() {
        return static_cast<std::uint32_t>(getgid());
    }
#else
    std::uint32_t PosixIdentityProvider::currentUserId() {
        throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "User ids are not available on this platform.");
    }

    std::uint32_t PosixIdentityProvider::currentGroupId() {
        throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "Group ids are not available on this platform.");
    }
#endif

    std::uint32_t UnsupportedIdentityProvider::currentUserId() {
        throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "User ids are not available on this platform.");
    }

    std::uint32_t UnsupportedIdentityProvider::currentGroupId() {
        throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "Group ids are not available on this platform.");
    }
}
