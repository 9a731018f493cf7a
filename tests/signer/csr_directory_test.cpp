#include "csr_directory.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "pki_fixtures.h"

namespace tollgate::signer {
namespace {

void ExpectInvalidName(const std::string& name) {
  try {
    ValidateRequestName(name);
    FAIL() << "Expected CsrDirectoryError for " << name;
  } catch (const CsrDirectoryError& ex) {
    EXPECT_EQ(ex.kind(), CsrDirectoryError::Kind::InvalidName);
  }
}

class CsrDirectoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = tollgate::testing::TempPath("csr_directory_test");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string path_;
};

TEST(CsrDirectoryNameTest, RejectsNamesThatEscapeTheDirectory) {
  ExpectInvalidName("");
  ExpectInvalidName(".");
  ExpectInvalidName("..");
  ExpectInvalidName("../etcd-0");
  ExpectInvalidName("etcd/0");
  ExpectInvalidName("etcd\\0");
  ExpectInvalidName(std::string("etcd\0x", 6));
  ExpectInvalidName(std::string(254, 'a'));
  ExpectInvalidName(".etcd-0");
  ExpectInvalidName(".tmp-1-0");

  EXPECT_NO_THROW(ValidateRequestName("system:etcd-peer:etcd-0.cluster.local"));
  EXPECT_NO_THROW(ValidateRequestName(std::string(253, 'a')));
  EXPECT_NO_THROW(ValidateRequestName("etcd-0.tmp"));
}

TEST_F(CsrDirectoryTest, CreatesDirectoryAndPersistsRequest) {
  CsrDirectory directory(path_ + "/nested");
  EXPECT_TRUE(std::filesystem::is_directory(path_ + "/nested"));

  CertificateSigningRequest request;
  request.mutable_metadata()->set_name("etcd-0");
  request.mutable_spec()->set_request("-----BEGIN CERTIFICATE REQUEST-----");
  auto* condition = request.mutable_status()->add_conditions();
  condition->set_type(certificates::v1::CONDITION_TYPE_APPROVED);
  condition->set_message("signed");
  request.mutable_status()->set_certificate("certificate bytes");
  directory.Write(request);

  const auto file = std::filesystem::path(path_) / "nested" / "etcd-0";
  ASSERT_TRUE(std::filesystem::exists(file));
  for (const auto& entry : std::filesystem::directory_iterator(file.parent_path())) {
    EXPECT_EQ(entry.path().filename().string(), "etcd-0");
  }
  const auto perms = std::filesystem::status(file).permissions();
  EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
            std::filesystem::perms::none);

  const auto loaded = directory.Read("etcd-0");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->metadata().name(), "etcd-0");
  EXPECT_EQ(loaded->status().certificate(), "certificate bytes");
  ASSERT_EQ(loaded->status().conditions_size(), 1);
  EXPECT_EQ(loaded->status().conditions(0).message(), "signed");
}

TEST_F(CsrDirectoryTest, WriteReplacesExistingRequest) {
  CsrDirectory directory(path_);
  CertificateSigningRequest request;
  request.mutable_metadata()->set_name("etcd-1");
  request.mutable_status()->set_certificate("first");
  directory.Write(request);
  request.mutable_status()->set_certificate("second");
  directory.Write(request);

  EXPECT_EQ(directory.Read("etcd-1")->status().certificate(), "second");
}

TEST_F(CsrDirectoryTest, WritesDoNotDisturbRequestsWithSuffixedNames) {
  CsrDirectory directory(path_);
  CertificateSigningRequest suffixed;
  suffixed.mutable_metadata()->set_name("etcd-0.tmp");
  suffixed.mutable_status()->set_certificate("suffixed");
  directory.Write(suffixed);

  CertificateSigningRequest plain;
  plain.mutable_metadata()->set_name("etcd-0");
  plain.mutable_status()->set_certificate("plain");
  directory.Write(plain);

  const auto loaded = directory.Read("etcd-0.tmp");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->status().certificate(), "suffixed");
  EXPECT_EQ(directory.Read("etcd-0")->status().certificate(), "plain");

  size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(path_)) {
    EXPECT_NE(entry.path().filename().string().front(), '.');
    ++files;
  }
  EXPECT_EQ(files, 2U);
}

TEST_F(CsrDirectoryTest, ConcurrentWritesOfOneNameStayConsistent) {
  CsrDirectory directory(path_);
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&directory, &failures, t] {
      CertificateSigningRequest request;
      request.mutable_metadata()->set_name("etcd-0");
      request.mutable_status()->set_certificate("writer-" + std::to_string(t));
      for (int i = 0; i < 200; ++i) {
        try {
          directory.Write(request);
          const auto loaded = directory.Read("etcd-0");
          if (!loaded.has_value() ||
              loaded->status().certificate().rfind("writer-", 0) != 0) {
            ++failures;
          }
        } catch (const CsrDirectoryError&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(path_)) {
    EXPECT_EQ(entry.path().filename().string(), "etcd-0");
    ++files;
  }
  EXPECT_EQ(files, 1U);
}

TEST_F(CsrDirectoryTest, MissingRequestReadsAsEmpty) {
  CsrDirectory directory(path_);
  EXPECT_FALSE(directory.Read("absent").has_value());
}

TEST_F(CsrDirectoryTest, CorruptRequestIsReported) {
  CsrDirectory directory(path_);
  {
    std::ofstream out(std::filesystem::path(path_) / "broken");
    out << "{not json";
  }
  try {
    directory.Read("broken");
    FAIL() << "Expected CsrDirectoryError";
  } catch (const CsrDirectoryError& ex) {
    EXPECT_EQ(ex.kind(), CsrDirectoryError::Kind::Corrupt);
  }
}

TEST_F(CsrDirectoryTest, InvalidNamesAreRejectedBeforeTouchingDisk) {
  CsrDirectory directory(path_);
  CertificateSigningRequest request;
  request.mutable_metadata()->set_name("../escape");
  EXPECT_THROW(directory.Write(request), CsrDirectoryError);
  EXPECT_THROW(directory.Read("../escape"), CsrDirectoryError);
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(path_).parent_path() /
                                       "escape"));
}

TEST(CsrDirectoryConstructionTest, RequiresDirectory) {
  try {
    CsrDirectory directory("");
    FAIL() << "Expected CsrDirectoryError";
  } catch (const CsrDirectoryError& ex) {
    EXPECT_EQ(ex.kind(), CsrDirectoryError::Kind::Io);
  }
}

}  // namespace
}  // namespace tollgate::signer
