#include "Generator.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <vector>

namespace unik {
    UUIDGenerator::UUIDGenerator(ClockSequence& clockSequence, TimeSource& timeSource, NodeProvider& nodeProvider,
                                 IdentityProvider& identityProvider, EntropySource& entropy)
        : mClockSequence(clockSequence), mTimeSource(timeSource), mNodeProvider(nodeProvider),
          mIdentityProvider(identityProvider), mEntropy(entropy), mOrgId(0), mHasOrgId(false) {}

    void UUIDGenerator::setOrgId(std::uint32_t orgId) {
        mOrgId = orgId;
        mHasOrgId = true;
    }

    Layout UUIDGenerator::timeLayout(Timestamp timestamp, const Node& node) {
        const Timestamp ts = timestamp & TIMESTAMP_MASK;
        return Layout(
            static_cast<std::uint32_t>(ts & 0xFFFFFFFF),
            static_cast<std::uint16_t>((ts >> 32) & 0xFFFF),
            static_cast<std::uint16_t>((ts >> 48) & 0x0FFF),
            mClockSequence.next(),
            node
        );
    }

    std::string UUIDGenerator::nameInput(const UUID& ns, const std::string& name) {
        return ns.toString(Case::LOWER) + name;
    }

    UUID UUIDGenerator::v1() {
        return v1(mTimeSource.now(), mNodeProvider.getNode());
    }

    UUID UUIDGenerator::v1(Timestamp timestamp, const Node& node) {
        Layout layout = timeLayout(timestamp, node);
        layout.tag(Version::TIME);
        return layout.pack();
    }

    UUID UUIDGenerator::v2(Domain domain) {
        std::uint32_t id = 0;
        switch (domain) {
            case Domain::PERSON:
                id = mIdentityProvider.currentUserId();
                break;
            case Domain::GROUP:
                id = mIdentityProvider.currentGroupId();
                break;
            case Domain::ORG:
                if (!mHasOrgId) {
                    throw GenerationError(GenerationErrorKind::UnsupportedPlatform, "The org domain requires an organization id.");
                }
                id = mOrgId;
                break;
        }
        return v2(domain, id);
    }

    UUID UUIDGenerator::v2(Domain domain, std::uint32_t id) {
        return v2(mTimeSource.now(), mNodeProvider.getNode(), domain, id);
    }

    UUID UUIDGenerator::v2(Timestamp timestamp, const Node& node, Domain domain, std::uint32_t id) {
        Layout layout = timeLayout(timestamp, node);
        layout.mTimeLow = id;
        // clock_seq_low contiene il dominio, resta la parte alta della sequenza
        layout.mClockSeq = static_cast<std::uint16_t>((layout.mClockSeq & 0xFF00) | static_cast<std::uint8_t>(domain));
        layout.tag(Version::DCE);
        return layout.pack();
    }

    UUID UUIDGenerator::v3(const UUID& ns, const std::string& name) {
        const std::vector<std::uint8_t> hash = Crypto::sha1(nameInput(ns, name));

        UUID::Bytes bytes;
        std::copy(hash.begin(), hash.begin() + UUID::SIZE, bytes.begin());

        Layout layout = Layout::unpack(UUID(bytes));
        layout.tag(Version::NAME_SHA1_TRUNCATED);
        return layout.pack();
    }

    UUID UUIDGenerator::v4() {
        UUID::Bytes bytes;
        mEntropy.fill(bytes.data(), bytes.size());

        Layout layout = Layout::unpack(UUID(bytes));
        layout.tag(Version::RANDOM);
        return layout.pack();
    }

    UUID UUIDGenerator::v5(const UUID& ns, const std::string& name) {
        const std::vector<std::uint8_t> hash = Crypto::md5(nameInput(ns, name));

        UUID::Bytes bytes;
        std::copy(hash.begin(), hash.begin() + UUID::SIZE, bytes.begin());

        Layout layout = Layout::unpack(UUID(bytes));
        layout.tag(Version::NAME_MD5);
        return layout.pack();
    }
}
