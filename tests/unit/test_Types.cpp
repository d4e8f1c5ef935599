#include <gtest/gtest.h>
#include "types/ProviderKind.hpp"
#include "types/UploadEntry.hpp"
#include "types/UploadError.hpp"
#include "types/Credentials.hpp"

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

using namespace fdrop::types;

TEST(ProviderKindTest, RoundTripsCanonicalNames) {
    EXPECT_EQ(to_string(ProviderKind::AnonymousHost), "anonymous");
    EXPECT_EQ(to_string(ProviderKind::CredentialedCloudStore), "cloud");
    EXPECT_EQ(provider_kind_from_string("anonymous"), ProviderKind::AnonymousHost);
    EXPECT_EQ(provider_kind_from_string("cloud"), ProviderKind::CredentialedCloudStore);
}

TEST(ProviderKindTest, AcceptsAliasesAndRejectsGarbage) {
    EXPECT_EQ(provider_kind_from_string("0x0"), ProviderKind::AnonymousHost);
    EXPECT_EQ(provider_kind_from_string("googledrive"), ProviderKind::CredentialedCloudStore);
    EXPECT_THROW(provider_kind_from_string("dropbox"), std::invalid_argument);
    EXPECT_THROW(provider_kind_from_string(""), std::invalid_argument);
}

TEST(UploadErrorTest, DescribeCarriesKindAndDetail) {
    const UploadError err(UploadError::Kind::Configuration, "credentials missing");
    EXPECT_EQ(err.kind(), UploadError::Kind::Configuration);
    EXPECT_STREQ(err.what(), "credentials missing");
    EXPECT_EQ(err.describe(), "Configuration error: credentials missing");
    EXPECT_EQ(describe(UploadError::Kind::Network, "HTTP 500"), "Network error: HTTP 500");
    EXPECT_EQ(describe(UploadError::Kind::Unknown, "x"), "Unknown error: x");
}

TEST(UploadEntryTest, DisplayNameFallsBackToWholePath) {
    EXPECT_EQ(displayNameFor("/var/tmp/photo.jpg"), "photo.jpg");
    EXPECT_EQ(displayNameFor("relative/notes.txt"), "notes.txt");
    EXPECT_EQ(displayNameFor("/var/tmp/"), "/var/tmp/");
}

TEST(UploadEntryTest, EntryIdRendersAsCanonicalUuid) {
    const auto id = boost::uuids::string_generator()("0f8e2c1a-5b3d-4e6f-9a0b-1c2d3e4f5a6b");
    EXPECT_EQ(fdrop::types::to_string(id), "0f8e2c1a-5b3d-4e6f-9a0b-1c2d3e4f5a6b");

    const nlohmann::json j = UploadEntry(id, "/tmp/a.bin");
    EXPECT_EQ(j.at("id"), "0f8e2c1a-5b3d-4e6f-9a0b-1c2d3e4f5a6b");
}

TEST(UploadEntryTest, JsonCarriesOptionalFieldsOnlyWhenSet) {
    UploadEntry e(boost::uuids::nil_uuid(), "/tmp/a.bin");
    nlohmann::json j = e;

    EXPECT_EQ(j.at("id"), "00000000-0000-0000-0000-000000000000");
    EXPECT_EQ(j.at("name"), "a.bin");
    EXPECT_EQ(j.at("state"), "idle");
    EXPECT_EQ(j.at("progress"), 0);
    EXPECT_FALSE(j.contains("url"));
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("provider"));

    e.state = UploadState::Success;
    e.progress = 100;
    e.provider = ProviderKind::AnonymousHost;
    e.resultUrl = "https://0x0.st/x.bin";
    j = e;

    EXPECT_EQ(j.at("state"), "success");
    EXPECT_EQ(j.at("provider"), "anonymous");
    EXPECT_EQ(j.at("url"), "https://0x0.st/x.bin");
}

TEST(CredentialsTest, JsonUsesCamelCaseKeys) {
    const Credentials c{"id-123", "secret-456"};
    const nlohmann::json j = c;
    EXPECT_EQ(j.at("clientId"), "id-123");
    EXPECT_EQ(j.at("clientSecret"), "secret-456");
    EXPECT_EQ(j.get<Credentials>(), c);
}
