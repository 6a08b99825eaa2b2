#include <gtest/gtest.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <platform/platform.hpp>
#include <ssh/connection_factory.hpp>
#include "fake_transport.hpp"

namespace fs = std::filesystem;

class ConnectionFactoryTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    ConnectionFactory pool{transport};

    static ConnectionTarget password_target(const std::string& host, int port = 22,
                                            const std::string& user = "admin") {
        return ConnectionTarget(host, port, PasswordAuth{user, "secret"});
    }
};

TEST_F(ConnectionFactoryTest, SameTargetReturnsSameConnection) {
    auto first = pool.get(password_target("proc.example.com"));
    auto second = pool.get(password_target("proc.example.com"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(pool.size(), 1u);
}

TEST_F(ConnectionFactoryTest, HostIsCaseInsensitive) {
    auto lower = pool.get(password_target("proc.example.com"));
    auto upper = pool.get(password_target("PROC.Example.COM"));
    EXPECT_EQ(lower, upper);
}

TEST_F(ConnectionFactoryTest, PortAndUserDistinguishTargets) {
    auto base = pool.get(password_target("proc.example.com", 22));
    auto other_port = pool.get(password_target("proc.example.com", 2222));
    auto other_user = pool.get(password_target("proc.example.com", 22, "operator"));
    auto other_host = pool.get(password_target("touch.example.com", 22));

    EXPECT_NE(base, other_port);
    EXPECT_NE(base, other_user);
    EXPECT_NE(base, other_host);
    EXPECT_EQ(pool.size(), 4u);
}

TEST_F(ConnectionFactoryTest, GetDoesNotConnect) {
    auto conn = pool.get(password_target("proc.example.com"));
    EXPECT_FALSE(conn->is_connected());
    EXPECT_EQ(transport->shell.connect_count(), 0);
    EXPECT_EQ(transport->sftp.connect_count(), 0);
}

TEST_F(ConnectionFactoryTest, NewConnectionsGetDefaultCeiling) {
    auto before = pool.get(password_target("a.example.com"));
    EXPECT_EQ(before->max_reconnection_attempts(), 0);

    pool.set_default_max_reconnection_attempts(5);
    auto after = pool.get(password_target("b.example.com"));
    EXPECT_EQ(after->max_reconnection_attempts(), 5);
    EXPECT_EQ(before->max_reconnection_attempts(), 0);

    EXPECT_THROW(pool.set_default_max_reconnection_attempts(-2), std::invalid_argument);
}

TEST_F(ConnectionFactoryTest, ReleaseAllDisposesAndClears) {
    auto first = pool.get(password_target("proc.example.com"));
    ASSERT_TRUE(first->ensure_shell().is_ok());

    pool.release_all();

    EXPECT_EQ(pool.size(), 0u);
    EXPECT_TRUE(first->is_disposed());
    EXPECT_FALSE(first->is_connected());

    auto second = pool.get(password_target("proc.example.com"));
    EXPECT_NE(first, second);
    EXPECT_FALSE(second->is_disposed());
}

TEST(ConnectionFactoryConstruct, RejectsNullTransport) {
    EXPECT_THROW({ ConnectionFactory pool(nullptr); }, std::invalid_argument);
}

// Points HOME at a scratch directory for the duration of a test.
class DefaultKeyTest : public ConnectionFactoryTest {
protected:
    fs::path home;
    std::string saved_home;

    void SetUp() override {
        const char* h = std::getenv("HOME");
        saved_home = h ? h : "";
        home = platform::temp_dir() / fmt::format("avlink_home_{}", std::time(nullptr));
        fs::remove_all(home);
        fs::create_directories(home / ".ssh");
        setenv("HOME", home.string().c_str(), 1);
    }

    void TearDown() override {
        setenv("HOME", saved_home.c_str(), 1);
        fs::remove_all(home);
    }
};

TEST_F(DefaultKeyTest, MissingKeyThrows) {
    EXPECT_THROW(pool.get("proc.example.com", 22, "admin"), std::invalid_argument);
}

TEST_F(DefaultKeyTest, FallsBackToEd25519) {
    std::ofstream(home / ".ssh" / "id_ed25519") << "key";

    auto conn = pool.get("proc.example.com", 22, "admin");
    ASSERT_TRUE(conn);
    ASSERT_TRUE(conn->target().uses_private_key());
    EXPECT_EQ(std::get<PrivateKeyAuth>(conn->target().identity()).key_path,
              (home / ".ssh" / "id_ed25519").string());
}

TEST_F(DefaultKeyTest, PrefersRsa) {
    std::ofstream(home / ".ssh" / "id_ed25519") << "key";
    std::ofstream(home / ".ssh" / "id_rsa") << "key";

    EXPECT_EQ(find_default_private_key(), (home / ".ssh" / "id_rsa").string());
}
