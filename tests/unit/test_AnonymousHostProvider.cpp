#include <gtest/gtest.h>
#include "cloud/AnonymousHostProvider.hpp"
#include "fakes.hpp"

#include <algorithm>

using namespace fdrop;
using namespace fdrop::types;

class AnonymousHostProviderTest : public ::testing::Test {
protected:
    std::shared_ptr<test::MockHttpClient> http = std::make_shared<test::MockHttpClient>();
    config::AnonymousHostConfig cfg;
    std::vector<uint8_t> bytes{'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

    [[nodiscard]] cloud::AnonymousHostProvider provider() const { return {http, cfg}; }
};

TEST_F(AnonymousHostProviderTest, ReturnsTrimmedResponseBody) {
    http->enqueue(200, "  https://0x0.st/abc.txt\n");

    EXPECT_EQ(provider().upload(bytes, "digits.txt"), "https://0x0.st/abc.txt");
    EXPECT_EQ(http->callCount(), 1u);
}

TEST_F(AnonymousHostProviderTest, SendsOneMultipartFieldWithUserAgent) {
    http->enqueue(200, "https://0x0.st/abc.txt");
    (void)provider().upload(bytes, "digits.txt");

    const auto req = http->requests().at(0);
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://0x0.st");
    ASSERT_EQ(req.form.size(), 1u);
    EXPECT_EQ(req.form[0].name, "file");
    EXPECT_EQ(req.form[0].filename, "digits.txt");
    EXPECT_EQ(req.form[0].data, "0123456789");
    EXPECT_EQ(req.form[0].contentType, "application/octet-stream");
    EXPECT_NE(std::ranges::find(req.headers, "User-Agent: FastDrop/1.0 (File Uploader)"), req.headers.end());
}

TEST_F(AnonymousHostProviderTest, NonSuccessStatusIsNetworkErrorWithStatusAndBody) {
    http->enqueue(503, "try later");

    try {
        (void)provider().upload(bytes, "digits.txt");
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), UploadError::Kind::Network);
        EXPECT_EQ(std::string(e.what()), "Upload to 0x0.st failed: HTTP 503 - try later");
    }
}

TEST_F(AnonymousHostProviderTest, TransportFailureIsNetworkError) {
    http->enqueueTransportError("Couldn't resolve host name");

    try {
        (void)provider().upload(bytes, "digits.txt");
        FAIL() << "expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.kind(), UploadError::Kind::Network);
        EXPECT_NE(std::string(e.what()).find("Couldn't resolve host name"), std::string::npos);
    }
}

TEST_F(AnonymousHostProviderTest, BlankBodyIsReturnedAsIs) {
    http->enqueue(200, " \n");
    EXPECT_EQ(provider().upload(bytes, "digits.txt"), "");
}

TEST_F(AnonymousHostProviderTest, NameIsEndpointHost) {
    cfg.endpoint = "https://files.example.org/";
    EXPECT_EQ(provider().name(), "files.example.org");
    EXPECT_EQ(provider().kind(), ProviderKind::AnonymousHost);
}
