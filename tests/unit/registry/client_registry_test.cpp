/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/client_registry_impl.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <system_error>

#include "mock/metrics_mock.hpp"
#include "registry/client_registry_error.hpp"
#include "testutil/prepare_loggers.hpp"

using ics02::Client;
using ics02::ClientRegistryError;
using ics02::ClientRegistryImpl;
using ics02::CreateResult;
using ics02::Outcome;
using ics02::RegistryState;

class ClientRegistryTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  auto makeRegistry(RegistryState state = {}) {
    return std::make_shared<ClientRegistryImpl>(
        testutil::prepareLoggers(),
        std::make_shared<ics02::metrics::MetricsMock>(),
        std::move(state));
  }
};

/**
 * @given empty registry
 * @when client is created at height 100
 * @then it gets id 0, heights {100}, and the next id becomes 1
 */
TEST_F(ClientRegistryTest, CreateOnEmptyRegistry) {
  auto registry = makeRegistry();

  EXPECT_EQ(registry->createClient(100),
            (CreateResult{.client_id = 0, .outcome = Outcome::CreateOK}));

  EXPECT_TRUE(registry->clientExists(0));
  EXPECT_EQ(registry->getClient(0), (Client{.heights = {100}}));
  EXPECT_EQ(registry->nextClientId(), 1);
}

/**
 * @given client 0 at height 100
 * @when it is updated to 150, then to 150 again, then to 90
 * @then first update is accepted, the repeated and the lower ones are rejected
 * and leave the heights untouched
 */
TEST_F(ClientRegistryTest, UpdateRequiresStrictlyGreaterHeight) {
  auto registry = makeRegistry();
  ASSERT_EQ(registry->createClient(100).outcome, Outcome::CreateOK);

  EXPECT_EQ(registry->updateClient(0, 150), Outcome::UpdateOK);
  EXPECT_EQ(registry->getClient(0), (Client{.heights = {100, 150}}));
  EXPECT_EQ(registry->getClient(0).latestHeight(), 150);
  auto before = registry->snapshot();

  EXPECT_EQ(registry->updateClient(0, 150),
            Outcome::HeaderVerificationFailure);
  EXPECT_EQ(registry->snapshot(), before);

  EXPECT_EQ(registry->updateClient(0, 90), Outcome::HeaderVerificationFailure);
  EXPECT_EQ(registry->snapshot(), before);
  EXPECT_EQ(before.next_client_id, 1);
}

/**
 * @given registry with client 0
 * @when client 7, which was never created, is updated
 * @then ClientNotFound is returned and the state is unchanged
 */
TEST_F(ClientRegistryTest, UpdateOfAbsentClient) {
  auto registry = makeRegistry();
  ASSERT_EQ(registry->createClient(100).outcome, Outcome::CreateOK);
  auto before = registry->snapshot();

  EXPECT_EQ(registry->updateClient(7, 200), Outcome::ClientNotFound);

  EXPECT_FALSE(registry->clientExists(7));
  EXPECT_EQ(registry->snapshot(), before);
}

TEST_F(ClientRegistryTest, SequentialCreatesAreIndependent) {
  auto registry = makeRegistry();

  EXPECT_EQ(registry->createClient(10),
            (CreateResult{.client_id = 0, .outcome = Outcome::CreateOK}));
  EXPECT_EQ(registry->createClient(20),
            (CreateResult{.client_id = 1, .outcome = Outcome::CreateOK}));

  EXPECT_EQ(registry->getClient(0), (Client{.heights = {10}}));
  EXPECT_EQ(registry->getClient(1), (Client{.heights = {20}}));
  EXPECT_EQ(registry->nextClientId(), 2);
}

/**
 * Client ids keep growing even when clients are created at the same or at a
 * lower height
 */
TEST_F(ClientRegistryTest, IdsAreNeverReused) {
  auto registry = makeRegistry();

  for (ics02::ClientId expected = 0; expected < 16; ++expected) {
    auto result = registry->createClient(5);
    EXPECT_EQ(result.client_id, expected);
    EXPECT_EQ(result.outcome, Outcome::CreateOK);
  }
  EXPECT_EQ(registry->nextClientId(), 16);
}

TEST_F(ClientRegistryTest, AbsentClientIsEmptySentinel) {
  auto registry = makeRegistry();

  auto client = registry->getClient(3);
  EXPECT_FALSE(client.exists());
  EXPECT_TRUE(client.heights.empty());
  EXPECT_EQ(client.latestHeight(), std::nullopt);
}

TEST_F(ClientRegistryTest, ReadsDoNotMutate) {
  auto registry = makeRegistry();
  ASSERT_EQ(registry->createClient(1).outcome, Outcome::CreateOK);
  ASSERT_EQ(registry->updateClient(0, 2), Outcome::UpdateOK);
  auto before = registry->snapshot();

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(registry->clientExists(0));
    EXPECT_FALSE(registry->clientExists(1));
    EXPECT_EQ(registry->getClient(0), (Client{.heights = {1, 2}}));
    EXPECT_FALSE(registry->getClient(1).exists());
  }

  EXPECT_EQ(registry->snapshot(), before);
}

/**
 * @given a sequence of updates with mixed heights
 * @then accepted heights are exactly the running maxima
 */
TEST_F(ClientRegistryTest, AcceptedHeightsAreStrictlyIncreasing) {
  auto registry = makeRegistry();
  ASSERT_EQ(registry->createClient(10).outcome, Outcome::CreateOK);

  std::vector<ics02::Height> submitted{5, 11, 11, 30, 12, 29, 31, 0, 100};
  std::vector<ics02::Height> accepted{10};
  for (auto height : submitted) {
    auto latest = registry->getClient(0).latestHeight().value();
    auto result = registry->updateClient(0, height);
    if (height > latest) {
      EXPECT_EQ(result, Outcome::UpdateOK) << height;
      accepted.push_back(height);
    } else {
      EXPECT_EQ(result, Outcome::HeaderVerificationFailure) << height;
    }
  }

  EXPECT_EQ(accepted, (std::vector<ics02::Height>{10, 11, 30, 31, 100}));
  auto heights = registry->getClient(0).heights;
  EXPECT_EQ(std::vector<ics02::Height>(heights.begin(), heights.end()),
            accepted);
}

TEST_F(ClientRegistryTest, RestoredStateIsServed) {
  RegistryState state{
      .clients = {{0, Client{.heights = {1, 5}}}, {2, Client{.heights = {7}}}},
      .next_client_id = 3,
  };
  auto registry = makeRegistry(state);

  EXPECT_EQ(registry->snapshot(), state);
  EXPECT_TRUE(registry->clientExists(0));
  EXPECT_FALSE(registry->clientExists(1));
  EXPECT_TRUE(registry->clientExists(2));

  EXPECT_EQ(registry->updateClient(2, 7), Outcome::HeaderVerificationFailure);
  EXPECT_EQ(registry->updateClient(1, 8), Outcome::ClientNotFound);
  EXPECT_EQ(registry->createClient(40).client_id, 3);
}

/**
 * A stored entry without heights is the absent sentinel: it neither exists
 * nor blocks allocation of its identifier
 */
TEST_F(ClientRegistryTest, EmptyEntryIsTreatedAsAbsent) {
  auto registry = makeRegistry(RegistryState{
      .clients = {{0, Client{}}},
      .next_client_id = 0,
  });

  EXPECT_FALSE(registry->clientExists(0));
  EXPECT_EQ(registry->updateClient(0, 1), Outcome::ClientNotFound);
  EXPECT_EQ(registry->createClient(9),
            (CreateResult{.client_id = 0, .outcome = Outcome::CreateOK}));
  EXPECT_EQ(registry->getClient(0), (Client{.heights = {9}}));
}

/**
 * @given restored state whose next client id points at an existing client
 * @when a client is created
 * @then the allocator violation is raised and nothing is mutated
 */
TEST_F(ClientRegistryTest, TakenIdentifierIsFatal) {
  RegistryState corrupted{
      .clients = {{0, Client{.heights = {10}}}},
      .next_client_id = 0,
  };
  auto registry = makeRegistry(corrupted);

  try {
    registry->createClient(50);
    FAIL() << "createClient must raise on a taken identifier";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code(), make_error_code(ClientRegistryError::CLIENT_ID_TAKEN));
  }

  EXPECT_EQ(registry->snapshot(), corrupted);
}

/**
 * @given restored state whose next client id is the largest identifier
 * @when a client is created
 * @then exhaustion is raised, the counter does not wrap and nothing is mutated
 */
TEST_F(ClientRegistryTest, ExhaustedIdentifiersAreFatal) {
  RegistryState last{
      .clients = {{5, Client{.heights = {1}}}},
      .next_client_id = std::numeric_limits<ics02::ClientId>::max(),
  };
  auto registry = makeRegistry(last);

  try {
    registry->createClient(1);
    FAIL() << "createClient must raise when identifiers are exhausted";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code(),
              make_error_code(ClientRegistryError::CLIENT_ID_EXHAUSTED));
  }

  EXPECT_EQ(registry->snapshot(), last);
  EXPECT_EQ(registry->nextClientId(),
            std::numeric_limits<ics02::ClientId>::max());
  EXPECT_FALSE(registry->clientExists(0));
}
