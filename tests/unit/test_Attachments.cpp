#include <gtest/gtest.h>
#include "crypto/attachments.hpp"
#include "crypto/encrypt.hpp"
#include "credentials/Credentials.hpp"
#include "datasource/errors.hpp"

#include <sodium.h>

using namespace lb::crypto;
using namespace lb::credentials;
using namespace lb::datasource;
using namespace lb::types;

class AttachmentCryptoTest : public ::testing::Test {
protected:
    Credentials creds = Credentials::fromPassword("attachment password");
    Buffer payload{'P', 'D', 'F', 0x00, 0x01, 0x02, 0xfe, 0xff};

    void SetUp() override {
        if (crypto_aead_aes256gcm_is_available() == 0)
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
    }
};

TEST_F(AttachmentCryptoTest, RoundTrip) {
    const auto encrypted = encryptAttachment(payload, creds);
    EXPECT_EQ(decryptAttachment(encrypted, creds), payload);
}

TEST_F(AttachmentCryptoTest, EncryptedPayloadStartsWithMarkerAndIsLarger) {
    const auto encrypted = encryptAttachment(payload, creds);
    ASSERT_GT(encrypted.size(), payload.size());
    EXPECT_EQ(encrypted.size(), ATTACHMENT_MARKER.size() + KDF_SALT_SIZE + AES_IV_SIZE + payload.size() + AES_TAG_SIZE);
    EXPECT_EQ(std::string(encrypted.begin(), encrypted.begin() + 4), ATTACHMENT_MARKER);
}

TEST_F(AttachmentCryptoTest, EmptyPayloadRoundTrips) {
    const auto encrypted = encryptAttachment({}, creds);
    EXPECT_TRUE(decryptAttachment(encrypted, creds).empty());
}

TEST_F(AttachmentCryptoTest, WrongPasswordIsDecodeFault) {
    const auto encrypted = encryptAttachment(payload, creds);
    const auto other = Credentials::fromPassword("not the password");
    EXPECT_THROW((void)decryptAttachment(encrypted, other), DecodeError);
}

TEST_F(AttachmentCryptoTest, ForeignDataIsDecodeFault) {
    EXPECT_THROW((void)decryptAttachment(payload, creds), DecodeError);
    EXPECT_THROW((void)decryptAttachment({}, creds), DecodeError);
}

TEST_F(AttachmentCryptoTest, TruncatedPayloadIsDecodeFault) {
    auto encrypted = encryptAttachment(payload, creds);
    encrypted.resize(ATTACHMENT_MARKER.size() + 3);
    EXPECT_THROW((void)decryptAttachment(encrypted, creds), DecodeError);
}

TEST_F(AttachmentCryptoTest, DecodeFaultReportsKind) {
    try {
        (void)decryptAttachment(payload, creds);
        FAIL() << "expected DecodeError";
    } catch (const DatasourceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeFault);
    }
}

TEST(AttachmentConstantsTest, Extension) {
    EXPECT_EQ(ATTACHMENT_EXT, "bcatt");
}
