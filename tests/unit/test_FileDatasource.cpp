#include <gtest/gtest.h>
#include "MemoryFileSystem.hpp"
#include "TempDir.hpp"

#include "credentials/Credentials.hpp"
#include "crypto/attachments.hpp"
#include "datasource/FileDatasource.hpp"
#include "datasource/errors.hpp"
#include "storage/LocalFileSystem.hpp"

#include <filesystem>
#include <fstream>
#include <sodium.h>

namespace fs = std::filesystem;

using namespace lb::credentials;
using namespace lb::datasource;
using namespace lb::types;

namespace {

class ThrowingCodec final : public ContentCodec {
public:
    [[nodiscard]] EncryptedContent encode(const History&, const Credentials&) const override {
        throw EncodeError("Failed to encode vault: serializer unavailable");
    }

    [[nodiscard]] History decode(const EncryptedContent&, const Credentials&) const override {
        throw DecodeError("Failed to decode vault: serializer unavailable");
    }
};

// Message of the DatasourceError thrown by fn, empty when nothing is thrown
template<typename Fn>
std::string faultMessage(Fn&& fn) {
    try {
        fn();
    } catch (const DatasourceError& e) {
        return e.what();
    }
    return {};
}

}

class FileDatasourceTest : public ::testing::Test {
protected:
    const fs::path vaultPath = "/data/vault.bcup";
    const History history = {"cmm \"initial\"", "cgr 0 4f3a", "tgr 4f3a \"General\""};

    std::shared_ptr<lb::test::MemoryFileSystem> memfs = std::make_shared<lb::test::MemoryFileSystem>();
    Credentials creds = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, std::nullopt}, "correct horse");
    Credentials otherCreds = Credentials::fromPassword("battery staple");

    void SetUp() override {
        if (crypto_aead_aes256gcm_is_available() == 0)
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
    }

    [[nodiscard]] std::unique_ptr<FileDatasource> makeDatasource() const {
        return std::make_unique<FileDatasource>(creds, memfs);
    }
};

TEST_F(FileDatasourceTest, ResolvesPathAndBaseDirFromCredentials) {
    const auto ds = makeDatasource();
    EXPECT_EQ(ds->path(), vaultPath);
    EXPECT_EQ(ds->baseDir(), fs::path("/data"));
    EXPECT_EQ(ds->type(), "file");
}

TEST_F(FileDatasourceTest, RejectsCredentialsWithoutPath) {
    const auto noPath = Credentials::fromPassword("pw");
    EXPECT_THROW({ FileDatasource ds(noPath, memfs); }, std::invalid_argument);
}

TEST_F(FileDatasourceTest, CapabilityFlags) {
    const auto ds = makeDatasource();
    EXPECT_TRUE(ds->supportsAttachments());
    EXPECT_TRUE(ds->supportsRemoteBypass());
}

TEST_F(FileDatasourceTest, SaveThenLoadWithFreshInstance) {
    makeDatasource()->save(history, creds);
    ASSERT_EQ(memfs->writes, 1u);
    EXPECT_TRUE(memfs->text(vaultPath).starts_with(TextCodec::SIGNATURE));

    const auto fresh = makeDatasource();
    EXPECT_EQ(fresh->load(creds), history);
    EXPECT_EQ(memfs->reads, 1u);
}

TEST_F(FileDatasourceTest, RepeatedLoadsReadStorageOnce) {
    makeDatasource()->save(history, creds);

    const auto ds = makeDatasource();
    const auto first = ds->load(creds);
    const auto second = ds->load(creds);
    const auto third = ds->load(creds);

    EXPECT_EQ(memfs->reads, 1u);
    EXPECT_EQ(first, history);
    EXPECT_EQ(second, first);
    EXPECT_EQ(third, first);
    EXPECT_TRUE(std::holds_alternative<CachedFromRead>(ds->contentState()));
}

TEST_F(FileDatasourceTest, BypassContentIsNeverReadFromStorage) {
    makeDatasource()->save(history, creds);
    const auto content = memfs->text(vaultPath);
    memfs->files.clear();

    const auto ds = makeDatasource();
    ds->setContent(content);
    EXPECT_TRUE(std::holds_alternative<CachedForBypass>(ds->contentState()));

    EXPECT_EQ(ds->load(creds), history);
    EXPECT_EQ(ds->load(creds), history);
    EXPECT_EQ(memfs->reads, 0u);
}

TEST_F(FileDatasourceTest, PresetContentInCredentialsStartsInBypass) {
    makeDatasource()->save(history, creds);
    const auto content = memfs->text(vaultPath);

    const auto preset = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, content}, "correct horse");
    FileDatasource ds(preset, memfs);

    EXPECT_TRUE(ds.hasContent());
    EXPECT_EQ(ds.load(preset), history);
    EXPECT_EQ(memfs->reads, 0u);
}

TEST_F(FileDatasourceTest, LoadMissingFileIsNotFoundAndStaysUnloaded) {
    const auto ds = makeDatasource();
    EXPECT_THROW(ds->load(creds), NotFoundError);
    EXPECT_TRUE(std::holds_alternative<Unloaded>(ds->contentState()));
}

TEST_F(FileDatasourceTest, LoadReadFailureIsStorageFault) {
    makeDatasource()->save(history, creds);
    memfs->failReads = true;

    const auto ds = makeDatasource();
    try {
        (void)ds->load(creds);
        FAIL() << "expected StorageError";
    } catch (const DatasourceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StorageFault);
    }
    EXPECT_FALSE(ds->hasContent());
}

TEST_F(FileDatasourceTest, LoadWithWrongPasswordIsDecodeFaultAndKeepsCache) {
    makeDatasource()->save(history, creds);

    const auto ds = makeDatasource();
    EXPECT_THROW(ds->load(otherCreds), DecodeError);
    EXPECT_TRUE(ds->hasContent());

    // the cached content still decodes with the right password, without another read
    EXPECT_EQ(ds->load(creds), history);
    EXPECT_EQ(memfs->reads, 1u);
}

TEST_F(FileDatasourceTest, LoadCorruptFileIsDecodeFault) {
    memfs->files[vaultPath] = {'n', 'o', 't', ' ', 'a', ' ', 'v', 'a', 'u', 'l', 't'};
    EXPECT_THROW(makeDatasource()->load(creds), DecodeError);
}

TEST_F(FileDatasourceTest, SaveOverwritesPreviousContent) {
    makeDatasource()->save(history, creds);

    History updated = history;
    updated.emplace_back("sep 4f3a title \"Email\"");
    makeDatasource()->save(updated, creds);

    EXPECT_EQ(makeDatasource()->load(creds), updated);
}

TEST_F(FileDatasourceTest, EncodeFailureWritesNothing) {
    FileDatasource ds(creds, memfs, std::make_shared<ThrowingCodec>());
    EXPECT_THROW(ds.save(history, creds), EncodeError);
    EXPECT_EQ(memfs->writes, 0u);
    EXPECT_FALSE(memfs->files.contains(vaultPath));
}

TEST_F(FileDatasourceTest, FaultMessagesNameTheLocation) {
    makeDatasource()->save(history, creds);
    const auto ds = makeDatasource();

    const auto decode = faultMessage([&] { (void)ds->load(otherCreds); });
    EXPECT_NE(decode.find(vaultPath.string()), std::string::npos) << decode;

    FileDatasource failing(creds, memfs, std::make_shared<ThrowingCodec>());
    const auto encode = faultMessage([&] { failing.save(history, creds); });
    EXPECT_NE(encode.find(vaultPath.string()), std::string::npos) << encode;

    ds->putAttachment("v1", "att1", {0x01, 0x02}, creds);
    const auto attachment = faultMessage([&] { (void)ds->getAttachment("v1", "att1", otherCreds); });
    EXPECT_NE(attachment.find("/data/.buttercup/v1/att1.bcatt"), std::string::npos) << attachment;

    const auto missing = faultMessage([&] { (void)ds->getAttachment("v1", "nope", creds); });
    EXPECT_NE(missing.find("/data/.buttercup/v1/nope.bcatt"), std::string::npos) << missing;
}

TEST_F(FileDatasourceTest, WriteFailureIsStorageFault) {
    memfs->failWrites = true;
    EXPECT_THROW(makeDatasource()->save(history, creds), StorageError);
}

TEST_F(FileDatasourceTest, SaveLeavesCachedContentUntouched) {
    makeDatasource()->save(history, creds);

    const auto ds = makeDatasource();
    ASSERT_EQ(ds->load(creds), history);

    ds->save({"cmm \"replaced\""}, creds);
    EXPECT_EQ(ds->load(creds), history);
    EXPECT_EQ(memfs->reads, 1u);

    ds->clearContent();
    EXPECT_EQ(ds->load(creds), History{"cmm \"replaced\""});
    EXPECT_EQ(memfs->reads, 2u);
}

TEST_F(FileDatasourceTest, EncryptedAttachmentRoundTrip) {
    const auto ds = makeDatasource();
    const Buffer payload = {0x01, 0x02};

    ds->putAttachment("v1", "att1", payload, creds);

    const fs::path expected = "/data/.buttercup/v1/att1.bcatt";
    ASSERT_TRUE(memfs->files.contains(expected));
    EXPECT_NE(memfs->files.at(expected), payload);

    EXPECT_EQ(ds->getAttachment("v1", "att1", creds), payload);
}

TEST_F(FileDatasourceTest, RawGetOfEncryptedAttachmentReturnsStoredBytes) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x10, 0x20, 0x30}, creds);

    const auto raw = ds->getAttachment("v1", "att1");
    EXPECT_EQ(raw, memfs->files.at("/data/.buttercup/v1/att1.bcatt"));
    EXPECT_EQ(std::string(raw.begin(), raw.begin() + 4), lb::crypto::ATTACHMENT_MARKER);
}

TEST_F(FileDatasourceTest, UnencryptedAttachmentPassesThroughUntouched) {
    const auto ds = makeDatasource();
    const Buffer payload = {0xde, 0xad, 0xbe, 0xef, 0x00};

    ds->putAttachment("v1", "blob", payload);
    EXPECT_EQ(memfs->files.at("/data/.buttercup/v1/blob.bcatt"), payload);
    EXPECT_EQ(ds->getAttachment("v1", "blob"), payload);
}

TEST_F(FileDatasourceTest, AttachmentWithWrongPasswordIsDecodeFault) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x01, 0x02}, creds);
    EXPECT_THROW(ds->getAttachment("v1", "att1", otherCreds), DecodeError);
}

TEST_F(FileDatasourceTest, DecryptingRawAttachmentIsDecodeFault) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "plain", {0x01, 0x02, 0x03});
    EXPECT_THROW(ds->getAttachment("v1", "plain", creds), DecodeError);
}

TEST_F(FileDatasourceTest, DetailsReportStoredSize) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x01, 0x02}, creds);

    const auto details = ds->getAttachmentDetails("v1", "att1");
    EXPECT_EQ(details.id, "att1");
    EXPECT_EQ(details.vaultID, "v1");
    EXPECT_EQ(details.name, "att1.bcatt");
    EXPECT_EQ(details.filename, fs::path("/data/.buttercup/v1/att1.bcatt"));
    EXPECT_EQ(details.size, memfs->files.at(details.filename).size());
    EXPECT_NE(details.size, 2u);
    EXPECT_FALSE(details.mime.has_value());
    EXPECT_EQ(memfs->reads, 0u);
}

TEST_F(FileDatasourceTest, DetailsOfRawAttachmentMatchInputLength) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "raw", Buffer(1234, 0x7f));
    EXPECT_EQ(ds->getAttachmentDetails("v1", "raw").size, 1234u);
}

TEST_F(FileDatasourceTest, PutOverwritesExistingAttachment) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x01}, creds);
    ds->putAttachment("v1", "att1", {0x02, 0x03}, creds);
    EXPECT_EQ(ds->getAttachment("v1", "att1", creds), (Buffer{0x02, 0x03}));
}

TEST_F(FileDatasourceTest, MissingAttachmentIsNotFound) {
    const auto ds = makeDatasource();
    EXPECT_THROW(ds->getAttachment("v1", "nope", creds), NotFoundError);
    EXPECT_THROW(ds->getAttachmentDetails("v1", "nope"), NotFoundError);
}

TEST_F(FileDatasourceTest, RemoveThenGetIsNotFound) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x01, 0x02}, creds);

    ds->removeAttachment("v1", "att1");
    EXPECT_FALSE(memfs->files.contains("/data/.buttercup/v1/att1.bcatt"));
    EXPECT_THROW(ds->getAttachment("v1", "att1"), NotFoundError);
}

TEST_F(FileDatasourceTest, RemovingMissingAttachmentIsNotFound) {
    EXPECT_THROW(makeDatasource()->removeAttachment("v1", "never-written"), NotFoundError);
}

TEST_F(FileDatasourceTest, EveryAttachmentOperationEnsuresDirectory) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "att1", {0x01});
    (void)ds->getAttachment("v1", "att1");
    (void)ds->getAttachmentDetails("v1", "att1");
    ds->removeAttachment("v1", "att1");

    EXPECT_EQ(memfs->mkdirs, 4u);
    EXPECT_TRUE(memfs->dirs.contains("/data/.buttercup/v1"));
}

TEST_F(FileDatasourceTest, DirectoryFailureIsStorageFaultAndSkipsWrite) {
    memfs->failMkdir = true;
    EXPECT_THROW(makeDatasource()->putAttachment("v1", "att1", {0x01}), StorageError);
    EXPECT_EQ(memfs->writes, 0u);
}

TEST_F(FileDatasourceTest, UnsafeIdentifiersAreRejectedBeforeIO) {
    const auto ds = makeDatasource();
    EXPECT_THROW(ds->putAttachment("../v1", "att1", {0x01}), std::invalid_argument);
    EXPECT_THROW(ds->putAttachment("v1", "a/b", {0x01}), std::invalid_argument);
    EXPECT_THROW(ds->getAttachment("..", "att1"), std::invalid_argument);
    EXPECT_THROW(ds->removeAttachment("v1", ""), std::invalid_argument);
    EXPECT_EQ(memfs->mkdirs, 0u);
    EXPECT_EQ(memfs->writes, 0u);
}

TEST_F(FileDatasourceTest, AttachmentsOfDistinctVaultsAreSeparate) {
    const auto ds = makeDatasource();
    ds->putAttachment("v1", "same", {0x01});
    ds->putAttachment("v2", "same", {0x02});

    EXPECT_EQ(ds->getAttachment("v1", "same"), Buffer{0x01});
    EXPECT_EQ(ds->getAttachment("v2", "same"), Buffer{0x02});
}

// Same protocol against the real filesystem

class FileDatasourceDiskTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path vaultPath;

    void SetUp() override {
        if (crypto_aead_aes256gcm_is_available() == 0)
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
        test_dir = lb::test::makeTestDir("lockbox_fds");
        vaultPath = test_dir / "vault.bcup";
    }

    void TearDown() override {
        if (!test_dir.empty()) fs::remove_all(test_dir);
    }
};

TEST_F(FileDatasourceDiskTest, SaveAndLoadScenario) {
    const auto credA = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, std::nullopt}, "credA");
    const History history = {"entry:A"};

    FileDatasource(credA, std::make_shared<lb::storage::LocalFileSystem>(false)).save(history, credA);
    ASSERT_TRUE(fs::exists(vaultPath));

    FileDatasource fresh(credA, std::make_shared<lb::storage::LocalFileSystem>(false));
    EXPECT_EQ(fresh.load(credA), history);
}

TEST_F(FileDatasourceDiskTest, AttachmentScenario) {
    const auto credA = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, std::nullopt}, "credA");
    FileDatasource ds(credA, std::make_shared<lb::storage::LocalFileSystem>(false));

    ds.putAttachment("v1", "att1", {0x01, 0x02}, credA);

    const auto expected = test_dir / ".buttercup" / "v1" / "att1.bcatt";
    ASSERT_TRUE(fs::is_regular_file(expected));

    const auto details = ds.getAttachmentDetails("v1", "att1");
    EXPECT_EQ(details.filename, expected);
    EXPECT_EQ(details.size, fs::file_size(expected));
    EXPECT_GT(details.size, 2u);

    EXPECT_EQ(ds.getAttachment("v1", "att1", credA), (Buffer{0x01, 0x02}));

    ds.removeAttachment("v1", "att1");
    EXPECT_FALSE(fs::exists(expected));
    EXPECT_THROW(ds.getAttachment("v1", "att1", credA), NotFoundError);
}

TEST_F(FileDatasourceDiskTest, AttachmentDirectoryBlockedByFileIsStorageFault) {
    const auto credA = Credentials::fromDatasource({FileDatasource::TYPE, vaultPath, std::nullopt}, "credA");
    FileDatasource ds(credA, std::make_shared<lb::storage::LocalFileSystem>(false));

    std::ofstream(test_dir / ".buttercup") << "not a directory";
    EXPECT_THROW(ds.putAttachment("v1", "att1", {0x01}), StorageError);
}
