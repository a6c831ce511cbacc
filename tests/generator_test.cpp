#include "framework.hpp"

#include "../shared-libs/Generator.hpp"
#include "../shared-libs/Errors.hpp"
#include "../shared-libs/crypto.hpp"

#include <set>
#include <vector>
#include <string>

using namespace unik;

namespace {
    const Timestamp TEST_TIMESTAMP = 0x1DD7A8F2C4B0000ULL;

    class FailingEntropySource : public EntropySource {
    public:
        void fill(std::uint8_t*, std::size_t) override {
            throw GenerationError(GenerationErrorKind::EntropySourceUnavailable, "entropy source closed");
        }
    };

    class FixedIdentityProvider : public IdentityProvider {
    public:
        std::uint32_t currentUserId() override { return 1000; }
        std::uint32_t currentGroupId() override { return 100; }
    };

    // dipendenze deterministiche per un generatore di test
    struct Fixture {
        OpenSSLEntropySource entropy;
        ClockSequence clockSequence;
        FixedTimeSource timeSource;
        FixedNodeProvider nodeProvider;
        FixedIdentityProvider identity;
        UUIDGenerator generator;

        Fixture()
            : clockSequence(static_cast<std::uint16_t>(0x1234)),
              timeSource(TEST_TIMESTAMP),
              nodeProvider(Node::fromString("00:1a:2b:3c:4d:5e")),
              generator(clockSequence, timeSource, nodeProvider, identity, entropy) {}
    };
}

void test_digests() {
    ASSERT_EQ(Crypto::sha1("abc").size(), Crypto::SHA1_SIZE);
    ASSERT_EQ(Crypto::md5("abc").size(), Crypto::MD5_SIZE);

    const std::vector<std::uint8_t> md5 = Crypto::md5("abc");
    ASSERT_EQ(static_cast<int>(md5[0]), 0x90);
    ASSERT_EQ(static_cast<int>(md5[15]), 0x72);

    const std::vector<std::uint8_t> sha1 = Crypto::sha1("abc");
    ASSERT_EQ(static_cast<int>(sha1[0]), 0xa9);
    ASSERT_EQ(static_cast<int>(sha1[19]), 0x9d);
}

void test_v1_fields() {
    Fixture f;
    const UUID uuid = f.generator.v1();

    ASSERT_EQ(uuid.toString(), std::string("2c4b0000-7a8f-11dd-9234-001a2b3c4d5e"));
    ASSERT_EQ(uuid.getVersion(), Version::TIME);
    ASSERT_EQ(uuid.getVariant(), Variant::RFC4122);

    const Layout layout = Layout::unpack(uuid);
    ASSERT_EQ(layout.getTimestamp(), TEST_TIMESTAMP);
    ASSERT_EQ(layout.getClockSequence(), 0x1234);
    ASSERT_EQ(layout.mNode, Node::fromString("001a2b3c4d5e"));
}

void test_v1_clock_sequence_advances() {
    Fixture f;
    const UUID first = f.generator.v1();
    const UUID second = f.generator.v1();

    // stesso tick, stesso nodo: cambia solo la sequenza di clock
    ASSERT_NE(first, second);
    ASSERT_EQ(Layout::unpack(second).getClockSequence(), Layout::unpack(first).getClockSequence() + 1);
}

void test_v1_timestamp_masked_to_60_bits() {
    Fixture f;
    const UUID uuid = f.generator.v1(0xF000000000000001ULL, Node());

    ASSERT_EQ(Layout::unpack(uuid).getTimestamp(), 1ULL);
    ASSERT_EQ(uuid.getVersion(), Version::TIME);
}

void test_v2_embeds_id_and_domain() {
    Fixture f;

    const UUID person = f.generator.v2(Domain::PERSON);
    ASSERT_EQ(person.getVersion(), Version::DCE);
    ASSERT_EQ(person.getVariant(), Variant::RFC4122);
    ASSERT_EQ(person.getDomain(), Domain::PERSON);
    ASSERT_EQ(Layout::unpack(person).mTimeLow, 1000u);

    const UUID group = f.generator.v2(Domain::GROUP);
    ASSERT_EQ(group.getDomain(), Domain::GROUP);
    ASSERT_EQ(Layout::unpack(group).mTimeLow, 100u);

    const UUID explicitId = f.generator.v2(Domain::ORG, 42);
    ASSERT_EQ(explicitId.getDomain(), Domain::ORG);
    ASSERT_EQ(Layout::unpack(explicitId).mTimeLow, 42u);

    // time_mid e time_hi restano quelli del timestamp
    const Layout layout = Layout::unpack(person);
    ASSERT_EQ(layout.mTimeMid, 0x7A8F);
    ASSERT_EQ(layout.mTimeHiAndVersion, 0x21DD);
    ASSERT_EQ(layout.mNode, Node::fromString("001a2b3c4d5e"));
}

void test_v2_org_requires_org_id() {
    Fixture f;
    ASSERT_THROWS_KIND(f.generator.v2(Domain::ORG), GenerationError, GenerationErrorKind::UnsupportedPlatform);

    f.generator.setOrgId(7);
    const UUID uuid = f.generator.v2(Domain::ORG);
    ASSERT_EQ(uuid.getDomain(), Domain::ORG);
    ASSERT_EQ(Layout::unpack(uuid).mTimeLow, 7u);
}

void test_v2_unsupported_identity() {
    OpenSSLEntropySource entropy;
    ClockSequence clockSequence(static_cast<std::uint16_t>(0));
    FixedTimeSource timeSource(TEST_TIMESTAMP);
    FixedNodeProvider nodeProvider(Node::fromString("001a2b3c4d5e"));
    UnsupportedIdentityProvider identity;
    UUIDGenerator generator(clockSequence, timeSource, nodeProvider, identity, entropy);

    ASSERT_THROWS_KIND(generator.v2(Domain::PERSON), GenerationError, GenerationErrorKind::UnsupportedPlatform);
    ASSERT_THROWS_KIND(generator.v2(Domain::GROUP), GenerationError, GenerationErrorKind::UnsupportedPlatform);

    // con l'id esplicito l'identità non serve
    ASSERT_EQ(generator.v2(Domain::PERSON, 1).getDomain(), Domain::PERSON);
}

void test_v3_pinned() {
    ASSERT_EQ(UUIDGenerator::v3(UUID::NAMESPACE_DNS, "test").toString(), std::string("2448bd95-00ca-364e-960f-3301a691b26c"));
    ASSERT_EQ(UUIDGenerator::v3(UUID::NAMESPACE_DNS, "python.org").toString(), std::string("07db3470-2422-3948-81a9-8f9c8bd56171"));
    ASSERT_EQ(UUIDGenerator::v3(UUID::NAMESPACE_URL, "").toString(), std::string("23069e19-9218-3ae4-9815-d8ceaade97df"));
}

void test_v5_pinned() {
    ASSERT_EQ(UUIDGenerator::v5(UUID::NAMESPACE_DNS, "test").toString(), std::string("4db109b9-c40e-5570-806b-af077eb8645e"));
    ASSERT_EQ(UUIDGenerator::v5(UUID::NAMESPACE_DNS, "python.org").toString(), std::string("2b34003e-e530-53a2-ab05-3ae045bf626a"));
    ASSERT_EQ(UUIDGenerator::v5(UUID::NAMESPACE_URL, "").toString(), std::string("e349a470-4e7c-5cab-8ac6-164a1fb252d3"));
}

void test_name_based_deterministic() {
    const UUID a = UUIDGenerator::v3(UUID::NAMESPACE_X500, "cn=unik");
    const UUID b = UUIDGenerator::v3(UUID::NAMESPACE_X500, "cn=unik");
    ASSERT_EQ(a, b);
    ASSERT_EQ(a.getVersion(), Version::NAME_SHA1_TRUNCATED);
    ASSERT_EQ(a.getVariant(), Variant::RFC4122);

    const UUID c = UUIDGenerator::v5(UUID::NAMESPACE_OID, "1.3.6.1");
    ASSERT_EQ(c, UUIDGenerator::v5(UUID::NAMESPACE_OID, "1.3.6.1"));
    ASSERT_EQ(c.getVersion(), Version::NAME_MD5);
    ASSERT_EQ(c.getVariant(), Variant::RFC4122);

    // namespace o nome diversi danno UUID diversi
    ASSERT_NE(a, UUIDGenerator::v3(UUID::NAMESPACE_DNS, "cn=unik"));
    ASSERT_NE(c, UUIDGenerator::v5(UUID::NAMESPACE_OID, "1.3.6.2"));
}

void test_v4_version_and_uniqueness() {
    Fixture f;
    std::set<UUID> seen;

    for (int i = 0; i < 10000; ++i) {
        const UUID uuid = f.generator.v4();
        ASSERT_EQ(uuid.getVersion(), Version::RANDOM);
        ASSERT_EQ(uuid.getVariant(), Variant::RFC4122);
        seen.insert(uuid);
    }

    ASSERT_EQ(seen.size(), 10000u);
}

void test_v4_entropy_unavailable() {
    FailingEntropySource entropy;
    ClockSequence clockSequence(static_cast<std::uint16_t>(0));
    FixedTimeSource timeSource(TEST_TIMESTAMP);
    FixedNodeProvider nodeProvider{Node()};
    PosixIdentityProvider identity;
    UUIDGenerator generator(clockSequence, timeSource, nodeProvider, identity, entropy);

    ASSERT_THROWS_KIND(generator.v4(), GenerationError, GenerationErrorKind::EntropySourceUnavailable);
    ASSERT_THROWS_KIND(ClockSequence{entropy}, GenerationError, GenerationErrorKind::EntropySourceUnavailable);
}

void test_generated_ids_round_trip() {
    Fixture f;
    const std::vector<UUID> ids = {
        f.generator.v1(),
        f.generator.v2(Domain::PERSON),
        UUIDGenerator::v3(UUID::NAMESPACE_URL, "https://www.ietf.org/rfc/rfc4122.txt"),
        f.generator.v4(),
        UUIDGenerator::v5(UUID::NAMESPACE_URL, "https://www.ietf.org/rfc/rfc4122.txt")
    };

    for (const UUID& id : ids) {
        ASSERT_EQ(UUID::parse(id.toString()), id);
        ASSERT_EQ(UUID::parse(id.toString(Case::UPPER)), id);
        ASSERT_EQ(UUID::parse(id.toHexString()), id);
        ASSERT_TRUE(Layout::unpack(id).pack() == id);
    }
}
