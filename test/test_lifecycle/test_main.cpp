#include <unity.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "Bridge.h"
#include "FakeMqttClient.h"
#include "Lifecycle.h"

using namespace mutedeck;

static const char* const exampleBody =
    "{\"call\":\"active\",\"control\":\"zoom\",\"mute\":\"inactive\","
    "\"record\":\"disabled\",\"share\":\"disabled\",\"video\":\"active\"}";

static FakeMqttClient* client = nullptr;
static DiscoveryCache* cache = nullptr;
static Publisher* publisher = nullptr;
static Bridge* bridge = nullptr;
static Lifecycle* lifecycle = nullptr;

void setUp() {
  client = new FakeMqttClient();
  cache = new DiscoveryCache();
  publisher = new Publisher(client);
  bridge = new Bridge(cache, publisher, "homeassistant");
  bridge->setDiscoveryDelay(0);
  lifecycle = new Lifecycle(cache, publisher);
}

void tearDown() {
  delete lifecycle;
  delete bridge;
  delete publisher;
  delete cache;
  delete client;
}

static void announce(const std::string& topic) {
  TEST_ASSERT_EQUAL(200,
                    bridge->handle(Request{exampleBody, topic, "", "10.0.0.2"})
                        .code);
}

void test_initial_state_is_offline() {
  TEST_ASSERT_TRUE(lifecycle->getState() == ConsumerState::OfflineOrUnknown);
  TEST_ASSERT_EQUAL_STRING("offline", consumerStateText(lifecycle->getState()));
}

void test_online_with_empty_cache_publishes_nothing() {
  TEST_ASSERT_EQUAL(0, lifecycle->handleStatus("online"));
  TEST_ASSERT_EQUAL(0, client->published().size());
  TEST_ASSERT_TRUE(lifecycle->getState() == ConsumerState::Online);
}

void test_online_replays_every_announced_document() {
  announce("desk");
  announce("office");
  auto before = client->published();
  client->clear();

  TEST_ASSERT_EQUAL(2, lifecycle->handleStatus("online"));

  auto replayed = client->published();
  TEST_ASSERT_EQUAL(2, replayed.size());
  for (const auto& m : replayed) {
    bool matched = false;
    for (const auto& first : before)
      if (first.topic == m.topic && first.payload == m.payload)
        matched = true;
    TEST_ASSERT_TRUE_MESSAGE(matched, m.topic.c_str());
    TEST_ASSERT_FALSE(m.retain);
  }
}

void test_replay_keeps_sent_flags() {
  announce("desk");
  lifecycle->handleStatus("online");
  client->clear();

  announce("desk");
  TEST_ASSERT_EQUAL(
      0, client->count("homeassistant/device/mutedeck2mqtt_device_desk/config"));
  TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/desk"));
}

void test_every_online_replays_again() {
  announce("desk");
  client->clear();
  lifecycle->handleStatus("online");
  lifecycle->handleStatus("online");
  TEST_ASSERT_EQUAL(
      2, client->count("homeassistant/device/mutedeck2mqtt_device_desk/config"));
}

void test_offline_and_other_payloads_publish_nothing() {
  announce("desk");
  client->clear();

  lifecycle->handleStatus("online");
  TEST_ASSERT_TRUE(lifecycle->getState() == ConsumerState::Online);
  client->clear();

  TEST_ASSERT_EQUAL(0, lifecycle->handleStatus("offline"));
  TEST_ASSERT_TRUE(lifecycle->getState() == ConsumerState::OfflineOrUnknown);
  TEST_ASSERT_EQUAL(0, lifecycle->handleStatus("Online"));
  TEST_ASSERT_EQUAL(0, lifecycle->handleStatus(""));
  TEST_ASSERT_EQUAL(0, lifecycle->handleStatus("restarting"));
  TEST_ASSERT_TRUE(lifecycle->getState() == ConsumerState::OfflineOrUnknown);
  TEST_ASSERT_EQUAL(0, client->published().size());
}

void test_replay_continues_past_failure() {
  announce("a");
  announce("b");
  announce("c");
  client->clear();
  client->fail("homeassistant/device/mutedeck2mqtt_device_b/config");

  TEST_ASSERT_EQUAL(2, lifecycle->handleStatus("online"));
  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_a/config"));
  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_c/config"));

  auto lock = cache->lock();
  TEST_ASSERT_TRUE(
      cache->isSent("homeassistant/device/mutedeck2mqtt_device_b/config"));
}

void test_replay_alongside_first_announcements() {
  const int topics = 12;
  std::atomic<bool> done{false};
  std::atomic<int> accepted{0};
  size_t replayed = 0;

  std::thread replayer([&]() {
    while (!done) replayed += lifecycle->handleStatus("online");
  });

  std::vector<std::thread> requests;
  for (int i = 0; i < topics; ++i) {
    requests.emplace_back([i, &accepted]() {
      Response response = bridge->handle(
          Request{exampleBody, "room" + std::to_string(i), "", "10.0.0.2"});
      if (response.code == 200) accepted++;
    });
  }
  for (std::thread& t : requests) t.join();
  done = true;
  replayer.join();

  TEST_ASSERT_EQUAL(topics, accepted.load());

  // discovery messages are the first announcements plus the replays
  size_t announced = 0;
  for (int i = 0; i < topics; ++i) {
    announced += client->count(
        discoveryTopic("homeassistant", "room" + std::to_string(i)));
    TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/room" + std::to_string(i)));
  }
  TEST_ASSERT_EQUAL(topics + replayed, announced);

  client->clear();
  TEST_ASSERT_EQUAL(topics, lifecycle->handleStatus("online"));
  for (int i = 0; i < topics; ++i) {
    const std::string key = discoveryTopic("homeassistant",
                                           "room" + std::to_string(i));
    TEST_ASSERT_EQUAL_MESSAGE(1, client->count(key), key.c_str());
  }
}

void test_lifecycle_topic() {
  TEST_ASSERT_EQUAL_STRING("homeassistant/status", lifecycleTopic);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_initial_state_is_offline);
  RUN_TEST(test_online_with_empty_cache_publishes_nothing);
  RUN_TEST(test_online_replays_every_announced_document);
  RUN_TEST(test_replay_keeps_sent_flags);
  RUN_TEST(test_every_online_replays_again);
  RUN_TEST(test_offline_and_other_payloads_publish_nothing);
  RUN_TEST(test_replay_continues_past_failure);
  RUN_TEST(test_replay_alongside_first_announcements);
  RUN_TEST(test_lifecycle_topic);
  return UNITY_END();
}
