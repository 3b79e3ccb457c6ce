/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/registry_state_yaml.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

using ics02::Client;
using ics02::RegistryState;
using ics02::RegistryStateYamlError;

TEST(RegistryStateYamlTest, DecodesSnapshot) {
  ASSERT_OUTCOME_SUCCESS(state, ics02::decodeRegistryState(YAML::Load(R"(
next_client_id: 3
clients:
  0: [100, 150]
  2: [20]
)")));

  EXPECT_EQ(state.next_client_id, 3);
  ASSERT_EQ(state.clients.size(), 2);
  EXPECT_EQ(state.clients.at(0), (Client{.heights = {100, 150}}));
  EXPECT_EQ(state.clients.at(2), (Client{.heights = {20}}));
}

TEST(RegistryStateYamlTest, MissingClientsMeansEmptyRegistry) {
  ASSERT_OUTCOME_SUCCESS(
      state, ics02::decodeRegistryState(YAML::Load("next_client_id: 5")));
  EXPECT_TRUE(state.clients.empty());
  EXPECT_EQ(state.next_client_id, 5);
}

/**
 * Encoded snapshot skips entries without heights and decodes back to the
 * existing clients only
 */
TEST(RegistryStateYamlTest, EncodeSkipsAbsentEntries) {
  RegistryState state{
      .clients = {{0, Client{.heights = {1, 2}}}, {1, Client{}}},
      .next_client_id = 2,
  };

  auto node = ics02::encodeRegistryState(state);
  EXPECT_EQ(node["next_client_id"].as<uint64_t>(), 2);
  EXPECT_EQ(node["clients"].size(), 1);

  YAML::Emitter emitter;
  emitter << node;
  ASSERT_OUTCOME_SUCCESS(decoded,
                         ics02::decodeRegistryState(YAML::Load(emitter.c_str())));
  EXPECT_EQ(decoded.next_client_id, 2);
  ASSERT_EQ(decoded.clients.size(), 1);
  EXPECT_EQ(decoded.clients.at(0), (Client{.heights = {1, 2}}));
}

TEST(RegistryStateYamlTest, RejectsMalformedSnapshots) {
  auto decode = [](const char *yaml) {
    return ics02::decodeRegistryState(YAML::Load(yaml));
  };

  EXPECT_OUTCOME_ERROR(decode("[1, 2]"));
  EXPECT_EQ(decode("[1, 2]").error(), RegistryStateYamlError::MAP_EXPECTED);
  EXPECT_EQ(decode("clients: {}").error(),
            RegistryStateYamlError::NEXT_CLIENT_ID_EXPECTED);
  EXPECT_EQ(decode("next_client_id: -1").error(),
            RegistryStateYamlError::INVALID_NUMBER);
  EXPECT_EQ(decode("next_client_id: 2\nclients: [1]").error(),
            RegistryStateYamlError::MAP_EXPECTED);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {0: 5}").error(),
            RegistryStateYamlError::HEIGHTS_SEQUENCE_EXPECTED);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {0: []}").error(),
            RegistryStateYamlError::EMPTY_HEIGHTS);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {0: [3, 3]}").error(),
            RegistryStateYamlError::DUPLICATE_HEIGHT);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {0: [1.5]}").error(),
            RegistryStateYamlError::INVALID_NUMBER);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {x: [1]}").error(),
            RegistryStateYamlError::INVALID_NUMBER);
  EXPECT_EQ(decode("next_client_id: 2\nclients: {2: [1]}").error(),
            RegistryStateYamlError::NEXT_CLIENT_ID_TOO_SMALL);
}

TEST(RegistryStateYamlTest, MissingFileIsReported) {
  auto res = ics02::loadRegistryState("/nonexistent/registry_state.yaml");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), RegistryStateYamlError::FILE_UNREADABLE);
}
