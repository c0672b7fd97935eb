#include "../mocks.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/client.hpp>
#include <kruise/sdk/config.hpp>

#include <set>

#include <gtest/gtest.h>

using namespace kruise::common;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

class ClientTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    service = std::make_shared<FakeSandboxService>();
    auto control_plane = std::make_shared<ControlPlane>(
        service, service->endpoint(),
        ControlPlane::Options{"", 30, 300, retry::Policy::pausing(30, 0ms)}
    );
    client = std::make_unique<Client>(
        control_plane, service, service->endpoint(),
        Client::Options{"code-interpreter", 30, retry::Policy::execution(5, 0ms)}
    );

    service->code_handler = [](const std::string& code) {
      if (code == "print(1+2)") {
        return FakeSandboxService::stdout_event("3\n") + FakeSandboxService::end_event();
      }
      return FakeSandboxService::end_event();
    };
  }

  std::shared_ptr<FakeSandboxService> service;
  std::unique_ptr<Client> client;
};

TEST_F(ClientTest, CreateAndRunCode)
{
  CreateOptions options;
  options.timeout = 30;
  options.metadata = {{"case", "A"}};
  auto sandbox = client->create(options);

  EXPECT_EQ(service->sandboxes[sandbox.id()].template_id, "code-interpreter");
  EXPECT_TRUE(sandbox.is_running());

  auto execution = sandbox.run_code("print(1+2)");
  EXPECT_EQ(execution.logs.std_out, std::vector<std::string>{"3\n"});
  EXPECT_FALSE(execution.error.has_value());

  EXPECT_EQ(sandbox.get_host(49999), fmt::format("sandbox.test/kruise/{}/49999", sandbox.id()));

  sandbox.kill();
  EXPECT_FALSE(sandbox.is_running());
  EXPECT_NO_THROW(sandbox.kill());
}

TEST_F(ClientTest, PauseThenConnect)
{
  service->pausing_polls = 4;
  auto sandbox = client->create();
  auto id = sandbox.id();

  sandbox.pause();
  EXPECT_FALSE(sandbox.is_running());

  sandbox.connect();
  EXPECT_EQ(sandbox.id(), id);
  EXPECT_TRUE(sandbox.is_running());
  // Resuming issues a new daemon token that the handle now uses.
  EXPECT_EQ(sandbox.connection().envd_access_token, service->sandboxes[id].access_token);

  auto result = sandbox.commands().run("echo resumed");
  EXPECT_EQ(result.std_out, "resumed\n");
  auto* req = service->last_request("/process.Process/Start");
  EXPECT_EQ(FakeSandboxService::find(req->headers, "X-Access-Token"), service->sandboxes[id].access_token);

  auto other = client->connect(id);
  EXPECT_EQ(other.id(), id);
}

TEST_F(ClientTest, CommandAndFiles)
{
  auto sandbox = client->create();

  EXPECT_THROW(sandbox.commands().run("false"), CommandExitError);

  sandbox.files().write("/home/user/data.txt", "payload");
  EXPECT_EQ(sandbox.files().read("/home/user/data.txt"), "payload");
}

TEST_F(ClientTest, ListAll)
{
  std::set<std::string> created;
  for (int i = 0; i < 5; ++i) {
    CreateOptions options;
    options.metadata = {{"suite", "client"}};
    created.insert(client->create(options).id());
  }
  client->create();

  SandboxQuery query;
  query.metadata = {{"suite", "client"}};

  std::set<std::string> listed;
  for (const auto& info : client->list_all(query, 2)) {
    listed.insert(info.sandbox_id);
  }
  EXPECT_EQ(listed, created);

  auto paginator = client->list(SandboxQuery{}, 4);
  EXPECT_EQ(paginator.next_items().size(), 4u);
  EXPECT_EQ(paginator.next_items().size(), 2u);
  EXPECT_FALSE(paginator.has_next());
}

TEST_F(ClientTest, SetTimeoutAndInfo)
{
  auto sandbox = client->create();

  sandbox.set_timeout(900);
  EXPECT_EQ(service->sandboxes[sandbox.id()].timeout, 900);

  auto info = client->get_info(sandbox.id());
  EXPECT_EQ(info.state, SandboxState::RUNNING);
  EXPECT_EQ(info.template_id, "code-interpreter");
}

TEST(Client, InjectedLifecycle)
{
  auto lifecycle = std::make_shared<MockLifecycle>();
  auto service = std::make_shared<FakeSandboxService>();
  Client client{
      lifecycle, service, service->endpoint(),
      Client::Options{"base", 30, retry::Policy::execution(1, 0ms)}};

  SandboxConnection conn;
  conn.sandbox_id = "sbx-mock";
  EXPECT_CALL(*lifecycle, create(Field(&CreateOptions::template_id, "base"))).WillOnce(Return(conn));
  EXPECT_CALL(*lifecycle, kill("sbx-mock")).Times(1);
  EXPECT_CALL(*lifecycle, get_info("sbx-gone"))
      .WillOnce(Throw(NotFoundError{"", "sandbox sbx-gone not found"}));

  auto sandbox = client.create();
  EXPECT_EQ(sandbox.id(), "sbx-mock");
  sandbox.kill();

  EXPECT_THROW(client.get_info("sbx-gone"), NotFoundError);
}

TEST(Client, FromConfig)
{
  kruise::sdk::config::Config cfg;
  cfg.domain = "";
  EXPECT_THROW(Client{cfg}, InvalidConfigurationError);
}
