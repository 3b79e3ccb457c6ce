/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/script_runner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "mock/metrics_mock.hpp"
#include "mock/registry/client_registry_mock.hpp"
#include "registry/client_registry_error.hpp"
#include "registry/impl/client_registry_impl.hpp"
#include "testutil/prepare_loggers.hpp"

using ics02::Client;
using ics02::ClientRegistryError;
using ics02::ClientRegistryMock;
using ics02::CreateResult;
using ics02::Outcome;
using ics02::relay::Operation;
using ics02::relay::ScriptRunner;
using ics02::relay::ScriptRunnerError;
using Kind = ics02::relay::Operation::Kind;
using ::testing::Return;
using ::testing::Throw;

/**
 * @given a real registry and the handshake scenario script
 * @when the script is run
 * @then every operation reports the expected outcome and rejections do not
 * stop the run
 */
TEST(ScriptRunnerTest, RunsHandshakeScenario) {
  auto logsys = testutil::prepareLoggers();
  auto registry = std::make_shared<ics02::ClientRegistryImpl>(
      logsys, std::make_shared<ics02::metrics::MetricsMock>());
  ScriptRunner runner{logsys, registry};

  std::vector<Operation> operations{
      {.kind = Kind::CREATE, .height = 100},
      {.kind = Kind::UPDATE, .client_id = 0, .height = 150},
      {.kind = Kind::UPDATE, .client_id = 0, .height = 150},
      {.kind = Kind::UPDATE, .client_id = 0, .height = 90},
      {.kind = Kind::UPDATE, .client_id = 7, .height = 200},
      {.kind = Kind::EXISTS, .client_id = 0},
      {.kind = Kind::EXISTS, .client_id = 7},
      {.kind = Kind::GET, .client_id = 0},
  };

  ASSERT_OUTCOME_SUCCESS(reports, runner.run(operations));
  ASSERT_EQ(reports.size(), operations.size());

  EXPECT_EQ(reports[0].outcome, Outcome::CreateOK);
  EXPECT_EQ(reports[0].client_id, 0);
  EXPECT_EQ(reports[1].outcome, Outcome::UpdateOK);
  EXPECT_EQ(reports[2].outcome, Outcome::HeaderVerificationFailure);
  EXPECT_EQ(reports[3].outcome, Outcome::HeaderVerificationFailure);
  EXPECT_EQ(reports[4].outcome, Outcome::ClientNotFound);
  EXPECT_EQ(reports[5].exists, true);
  EXPECT_EQ(reports[6].exists, false);
  EXPECT_FALSE(reports[7].outcome.has_value());
  EXPECT_EQ(reports[7].client, (Client{.heights = {100, 150}}));

  auto summary = ics02::relay::summarize(reports);
  EXPECT_EQ(summary[Outcome::CreateOK], 1);
  EXPECT_EQ(summary[Outcome::UpdateOK], 1);
  EXPECT_EQ(summary[Outcome::HeaderVerificationFailure], 2);
  EXPECT_EQ(summary[Outcome::ClientNotFound], 1);
  EXPECT_EQ(summary.count(Outcome::ModelError), 0);
}

/**
 * @given registry raising an allocator violation on the second create
 * @when a script with three creates is run
 * @then the run stops at the violation with a fatal error
 */
TEST(ScriptRunnerTest, StopsOnFatalRegistryError) {
  auto registry = std::make_shared<ClientRegistryMock>();
  ScriptRunner runner{testutil::prepareLoggers(), registry};

  EXPECT_CALL(*registry, createClient(1))
      .WillOnce(Return(CreateResult{.client_id = 0,
                                    .outcome = Outcome::CreateOK}));
  EXPECT_CALL(*registry, createClient(2))
      .WillOnce(Throw(std::system_error(
          make_error_code(ClientRegistryError::CLIENT_ID_TAKEN))));
  EXPECT_CALL(*registry, createClient(3)).Times(0);

  auto res = runner.run({
      {.kind = Kind::CREATE, .height = 1},
      {.kind = Kind::CREATE, .height = 2},
      {.kind = Kind::CREATE, .height = 3},
  });
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), ScriptRunnerError::FATAL_REGISTRY_ERROR);
}

TEST(ScriptRunnerTest, PassesArgumentsThrough) {
  auto registry = std::make_shared<ClientRegistryMock>();
  ScriptRunner runner{testutil::prepareLoggers(), registry};

  EXPECT_CALL(*registry, updateClient(4, 44))
      .WillOnce(Return(Outcome::UpdateOK));
  EXPECT_CALL(*registry, clientExists(5)).WillOnce(Return(false));
  EXPECT_CALL(*registry, getClient(6))
      .WillOnce(Return(Client{.heights = {60}}));

  ASSERT_OUTCOME_SUCCESS(reports,
                         runner.run({
                             {.kind = Kind::UPDATE, .client_id = 4, .height = 44},
                             {.kind = Kind::EXISTS, .client_id = 5},
                             {.kind = Kind::GET, .client_id = 6},
                         }));
  ASSERT_EQ(reports.size(), 3);
  EXPECT_EQ(reports[0].outcome, Outcome::UpdateOK);
  EXPECT_EQ(reports[1].exists, false);
  EXPECT_EQ(reports[2].client, (Client{.heights = {60}}));
}
