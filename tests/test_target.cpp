#include <gtest/gtest.h>
#include <ssh/target.hpp>

TEST(ConnectionTarget, TrimsHost) {
    ConnectionTarget target("  10.1.2.3 ", 22, PasswordAuth{"admin", "pw"});
    EXPECT_EQ(target.host(), "10.1.2.3");
    EXPECT_EQ(target.display(), "admin@10.1.2.3:22");
}

TEST(ConnectionTarget, RejectsInvalidInput) {
    EXPECT_THROW(ConnectionTarget("", 22, PasswordAuth{"admin", "pw"}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("   ", 22, PasswordAuth{"admin", "pw"}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("host", 0, PasswordAuth{"admin", "pw"}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("host", 65536, PasswordAuth{"admin", "pw"}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("host", 22, PasswordAuth{"", "pw"}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("host", 22, PasswordAuth{"admin", ""}), std::invalid_argument);
    EXPECT_THROW(ConnectionTarget("host", 22, PrivateKeyAuth{"admin", "", ""}), std::invalid_argument);
}

TEST(ConnectionTarget, KeyIgnoresCase) {
    ConnectionTarget lower("device.local", 22, PasswordAuth{"admin", "pw"});
    ConnectionTarget upper("DEVICE.Local", 22, PasswordAuth{"Admin", "other"});
    ConnectionTarget port("device.local", 2222, PasswordAuth{"admin", "pw"});

    EXPECT_EQ(lower.key(), "device.local:22:admin");
    EXPECT_EQ(lower.key(), upper.key());
    EXPECT_NE(lower.key(), port.key());
}

TEST(ConnectionTarget, IdentityKinds) {
    ConnectionTarget pw("host", 22, PasswordAuth{"admin", "pw"});
    ConnectionTarget key("host", 22, PrivateKeyAuth{"svc", "/home/svc/.ssh/id_rsa", ""});

    EXPECT_FALSE(pw.uses_private_key());
    EXPECT_TRUE(key.uses_private_key());
    EXPECT_EQ(key.user(), "svc");
    EXPECT_EQ(std::get<PrivateKeyAuth>(key.identity()).key_path, "/home/svc/.ssh/id_rsa");
}
