#include "../mocks.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/filesystem.hpp>

#include <gtest/gtest.h>

using namespace kruise::common;

class FilesystemTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    service = std::make_shared<FakeSandboxService>();
    sandbox_id = service->add_sandbox(SandboxState::RUNNING);
    files = std::make_unique<Filesystem>(fake_context(service, sandbox_id));
  }

  std::shared_ptr<FakeSandboxService> service;
  std::string sandbox_id;
  std::unique_ptr<Filesystem> files;
};

TEST_F(FilesystemTest, WriteRead)
{
  std::string content = "Why do programmers prefer dark mode?\r\nBecause light attracts bugs.\n";

  auto entry = files->write("/home/user/my-file", content);
  EXPECT_EQ(entry.name, "my-file");
  EXPECT_EQ(entry.type, "file");
  EXPECT_EQ(entry.path, "/home/user/my-file");
  EXPECT_EQ(service->files["/home/user/my-file"], content);

  EXPECT_EQ(files->read("/home/user/my-file"), content);

  auto* req = service->last_request("/files");
  ASSERT_NE(req, nullptr);
  EXPECT_EQ(FakeSandboxService::find(req->parameters, "path"), "/home/user/my-file");
  EXPECT_EQ(FakeSandboxService::find(req->parameters, "username"), "user");
}

TEST_F(FilesystemTest, WriteFiles)
{
  auto entries = files->write_files({{"/path/to/a", "file a content"}, {"/path/to/b", "file b content"}});

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].path, "/path/to/a");
  EXPECT_EQ(entries[1].path, "/path/to/b");
  EXPECT_EQ(files->read("/path/to/a"), "file a content");
  EXPECT_EQ(files->read("/path/to/b"), "file b content");
}

TEST_F(FilesystemTest, MissingFile)
{
  EXPECT_THROW(files->read("/home/user/none"), NotFoundError);
}
