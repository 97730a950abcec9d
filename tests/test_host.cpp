#include <gtest/gtest.h>
#include <core/host.hpp>

TEST(HostIdentity, KeyIsUserHostPort) {
    auto h = make_host_identity("10.0.0.5", "admin", std::string("pw"), std::nullopt, 2222, 30);
    ASSERT_TRUE(h.is_ok()) << h.error;
    EXPECT_EQ(h.value.key(), "admin@10.0.0.5:2222");
}

TEST(HostIdentity, DefaultsMatchInventoryDefaults) {
    HostIdentity h;
    EXPECT_EQ(h.port(), 22);
    EXPECT_EQ(h.timeout_secs(), 30);
    EXPECT_TRUE(h.tags().empty());
}

TEST(HostIdentity, KeyFileWinsOverPassword) {
    auto auth = resolve_auth(std::string("secret"), std::string("~/.ssh/id_ed25519"));
    ASSERT_TRUE(auth.is_ok());
    ASSERT_TRUE(std::holds_alternative<KeyFileAuth>(auth.value));
    EXPECT_EQ(std::get<KeyFileAuth>(auth.value).path, "~/.ssh/id_ed25519");
    EXPECT_EQ(auth_kind(auth.value), "key");
}

TEST(HostIdentity, PasswordWhenNoKey) {
    auto auth = resolve_auth(std::string("secret"), std::nullopt);
    ASSERT_TRUE(auth.is_ok());
    EXPECT_EQ(std::get<PasswordAuth>(auth.value).secret, "secret");
    EXPECT_EQ(auth_kind(auth.value), "password");
}

TEST(HostIdentity, EmptyKeyPathFallsBackToPassword) {
    auto auth = resolve_auth(std::string("secret"), std::string(""));
    ASSERT_TRUE(auth.is_ok());
    EXPECT_EQ(auth_kind(auth.value), "password");
}

TEST(HostIdentity, NoCredentialsIsAnError) {
    auto auth = resolve_auth(std::nullopt, std::nullopt);
    EXPECT_TRUE(auth.is_err());

    auto h = make_host_identity("web1", "admin", std::nullopt, std::nullopt, 22, 30);
    EXPECT_TRUE(h.is_err());
}

TEST(HostIdentity, RejectsInvalidFields) {
    EXPECT_TRUE(make_host_identity("", "admin", std::string("pw"), std::nullopt, 22, 30).is_err());
    EXPECT_TRUE(make_host_identity("web1", "", std::string("pw"), std::nullopt, 22, 30).is_err());
    EXPECT_TRUE(make_host_identity("web1", "admin", std::string("pw"), std::nullopt, 0, 30).is_err());
    EXPECT_TRUE(make_host_identity("web1", "admin", std::string("pw"), std::nullopt, 70000, 30).is_err());
    EXPECT_TRUE(make_host_identity("web1", "admin", std::string("pw"), std::nullopt, 22, 0).is_err());
}

TEST(HostIdentity, KeepsTags) {
    auto h = make_host_identity("db.example", "ops", std::nullopt, std::string("/keys/db"),
                                22, 10, {"db", "prod"});
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(h.value.uses_key_file());
    ASSERT_EQ(h.value.tags().size(), 2u);
    EXPECT_EQ(h.value.tags()[1], "prod");
}
