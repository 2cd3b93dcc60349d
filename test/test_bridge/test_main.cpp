#include <ArduinoJson.h>
#include <unity.h>

#include <string>
#include <thread>
#include <vector>

#include "Bridge.h"
#include "FakeMqttClient.h"

using namespace mutedeck;

static const char* const exampleBody =
    "{\"call\":\"active\",\"control\":\"zoom\",\"mute\":\"inactive\","
    "\"record\":\"disabled\",\"share\":\"disabled\",\"video\":\"active\"}";

static FakeMqttClient* client = nullptr;
static DiscoveryCache* cache = nullptr;
static Publisher* publisher = nullptr;
static Bridge* bridge = nullptr;

void setUp() {
  client = new FakeMqttClient();
  cache = new DiscoveryCache();
  publisher = new Publisher(client);
  bridge = new Bridge(cache, publisher, "homeassistant");
  bridge->setDiscoveryDelay(0);
  logger.clear();
}

void tearDown() {
  delete bridge;
  delete publisher;
  delete cache;
  delete client;
}

static Request request(const std::string& body, const std::string& topic = "",
                       const std::string& prefix = "") {
  return Request{body, topic, prefix, "10.0.0.2"};
}

void test_first_request_announces_then_publishes() {
  Response response = bridge->handle(request(exampleBody, "MyRoom"));
  TEST_ASSERT_EQUAL(200, response.code);
  TEST_ASSERT_EQUAL_STRING("", response.body.c_str());

  auto messages = client->published();
  TEST_ASSERT_EQUAL(2, messages.size());
  TEST_ASSERT_EQUAL_STRING(
      "homeassistant/device/mutedeck2mqtt_device_MyRoom/config",
      messages[0].topic.c_str());
  TEST_ASSERT_EQUAL_STRING(
      buildDiscovery("MyRoom", "mutedeck2mqtt").toJson().c_str(),
      messages[0].payload.c_str());

  TEST_ASSERT_EQUAL_STRING("mutedeck2mqtt/MyRoom", messages[1].topic.c_str());
  TEST_ASSERT_EQUAL_STRING(
      "{\"call\":\"active\",\"control\":\"Zoom\",\"mute\":\"inactive\","
      "\"record\":\"disabled\",\"share\":\"disabled\",\"video\":\"active\"}",
      messages[1].payload.c_str());

  for (const auto& m : messages) {
    TEST_ASSERT_EQUAL(0, m.qos);
    TEST_ASSERT_FALSE(m.retain);
  }
}

void test_discovery_sent_once_per_topic() {
  const int requests = 5;
  for (int i = 0; i < requests; ++i)
    TEST_ASSERT_EQUAL(200, bridge->handle(request(exampleBody, "MyRoom")).code);

  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_MyRoom/config"));
  TEST_ASSERT_EQUAL(requests, client->count("mutedeck2mqtt/MyRoom"));
}

void test_each_topic_announced_separately() {
  bridge->handle(request(exampleBody, "desk"));
  bridge->handle(request(exampleBody, "office"));
  bridge->handle(request(exampleBody, "desk"));

  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_desk/config"));
  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_office/config"));
  auto lock = cache->lock();
  TEST_ASSERT_EQUAL(2, cache->size());
}

void test_missing_key_rejected_without_publishing() {
  Response response = bridge->handle(request(
      "{\"call\":\"active\",\"control\":\"zoom\",\"mute\":\"inactive\","
      "\"record\":\"disabled\",\"share\":\"disabled\"}"));
  TEST_ASSERT_EQUAL(400, response.code);
  TEST_ASSERT_EQUAL_STRING("Missing required key: video",
                           response.body.c_str());
  TEST_ASSERT_EQUAL(0, client->published().size());

  auto lock = cache->lock();
  TEST_ASSERT_EQUAL(0, cache->size());
}

void test_malformed_body_rejected() {
  const std::string trailing = std::string(exampleBody) + "garbage";
  const std::string second = std::string(exampleBody) + "{}";
  const char* bodies[] = {"{\"call\":", "", "not json", trailing.c_str(),
                          second.c_str()};
  for (const char* body : bodies) {
    Response response = bridge->handle(request(body));
    TEST_ASSERT_EQUAL_MESSAGE(400, response.code, body);
    TEST_ASSERT_TRUE(response.body.size() > 0);
  }
  TEST_ASSERT_EQUAL(0, client->published().size());
}

void test_trailing_whitespace_accepted() {
  const std::string body = std::string(" ") + exampleBody + " \r\n";
  TEST_ASSERT_EQUAL(200, bridge->handle(request(body)).code);
  TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/mutedeck"));
}

void test_null_body_reports_first_missing_key() {
  Response response = bridge->handle(request("null"));
  TEST_ASSERT_EQUAL(400, response.code);
  TEST_ASSERT_EQUAL_STRING("Missing required key: call", response.body.c_str());
  TEST_ASSERT_EQUAL(0, client->published().size());
}

void test_status_keys_published_sorted() {
  bridge->handle(request(
      "{\"video\":\"active\",\"share\":\"disabled\",\"extra\":{\"b\":1,"
      "\"a\":[2,{\"d\":3,\"c\":4}]},\"record\":\"disabled\","
      "\"mute\":\"inactive\",\"control\":\"zoom\",\"call\":\"active\"}"));

  auto messages = client->published();
  TEST_ASSERT_EQUAL(2, messages.size());
  TEST_ASSERT_EQUAL_STRING(
      "{\"call\":\"active\",\"control\":\"Zoom\",\"extra\":{\"a\":[2,"
      "{\"c\":4,\"d\":3}],\"b\":1},\"mute\":\"inactive\","
      "\"record\":\"disabled\",\"share\":\"disabled\",\"video\":\"active\"}",
      messages[1].payload.c_str());
}

void test_non_object_body_rejected() {
  Response response = bridge->handle(request("[1,2,3]"));
  TEST_ASSERT_EQUAL(400, response.code);
  TEST_ASSERT_EQUAL_STRING("Invalid JSON object", response.body.c_str());
  TEST_ASSERT_EQUAL(0, client->published().size());
}

void test_failed_discovery_is_retried_on_next_request() {
  const std::string key =
      "homeassistant/device/mutedeck2mqtt_device_mutedeck/config";
  client->fail(key);

  Response response = bridge->handle(request(exampleBody));
  TEST_ASSERT_EQUAL(500, response.code);
  TEST_ASSERT_EQUAL_STRING(("broker rejected " + key).c_str(),
                           response.body.c_str());
  TEST_ASSERT_EQUAL(0, client->count("mutedeck2mqtt/mutedeck"));
  {
    auto lock = cache->lock();
    TEST_ASSERT_FALSE(cache->isSent(key));
  }

  client->recover();
  TEST_ASSERT_EQUAL(200, bridge->handle(request(exampleBody)).code);
  TEST_ASSERT_EQUAL(1, client->count(key));
  TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/mutedeck"));
}

void test_failed_status_keeps_discovery_mark() {
  const std::string key =
      "homeassistant/device/mutedeck2mqtt_device_mutedeck/config";
  client->fail("mutedeck2mqtt/mutedeck");

  Response response = bridge->handle(request(exampleBody));
  TEST_ASSERT_EQUAL(500, response.code);
  TEST_ASSERT_EQUAL(1, client->count(key));
  {
    auto lock = cache->lock();
    TEST_ASSERT_TRUE(cache->isSent(key));
  }

  client->recover();
  TEST_ASSERT_EQUAL(200, bridge->handle(request(exampleBody)).code);
  TEST_ASSERT_EQUAL(1, client->count(key));
  TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/mutedeck"));
}

void test_defaults_for_topic_and_prefix() {
  TEST_ASSERT_EQUAL(200, bridge->handle(request(exampleBody)).code);
  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_mutedeck/config"));
  TEST_ASSERT_EQUAL(1, client->count("mutedeck2mqtt/mutedeck"));
}

void test_custom_prefix_routes_status() {
  TEST_ASSERT_EQUAL(200,
                    bridge->handle(request(exampleBody, "desk", "office/mute")).code);
  TEST_ASSERT_EQUAL(1, client->count("office/mute/desk"));

  auto messages = client->published();
  JsonDocument doc;
  deserializeJson(doc, messages[0].payload);
  TEST_ASSERT_EQUAL_STRING("office/mute/desk", doc["stat_t"].as<const char*>());
}

void test_custom_discovery_root() {
  Bridge custom(cache, publisher, "ha");
  custom.setDiscoveryDelay(0);
  TEST_ASSERT_EQUAL(200, custom.handle(request(exampleBody, "desk")).code);
  TEST_ASSERT_EQUAL(1, client->count("ha/device/mutedeck2mqtt_device_desk/config"));
}

void test_extra_fields_pass_through() {
  bridge->handle(request(
      "{\"call\":\"active\",\"control\":\"teams-new\",\"mute\":\"active\","
      "\"record\":\"disabled\",\"share\":\"disabled\",\"video\":\"inactive\","
      "\"battery\":87,\"note\":\"zoom\"}"));

  auto messages = client->published();
  TEST_ASSERT_EQUAL(2, messages.size());
  JsonDocument doc;
  deserializeJson(doc, messages[1].payload);
  TEST_ASSERT_EQUAL_STRING("Teams", doc["control"].as<const char*>());
  TEST_ASSERT_EQUAL(87, doc["battery"].as<int>());
  TEST_ASSERT_EQUAL_STRING("zoom", doc["note"].as<const char*>());
}

void test_missing_key_logged_with_client_address() {
  bridge->handle(request("{\"call\":\"active\"}"));
  const std::string logs = logger.getLogs();
  TEST_ASSERT_TRUE(logs.find("Request from 10.0.0.2 missing required key: "
                             "control") != std::string::npos);
}

void test_concurrent_requests_announce_once() {
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i)
    threads.emplace_back([]() { bridge->handle(request(exampleBody, "race")); });
  for (std::thread& t : threads) t.join();

  TEST_ASSERT_EQUAL(
      1, client->count("homeassistant/device/mutedeck2mqtt_device_race/config"));
  TEST_ASSERT_EQUAL(8, client->count("mutedeck2mqtt/race"));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_first_request_announces_then_publishes);
  RUN_TEST(test_discovery_sent_once_per_topic);
  RUN_TEST(test_each_topic_announced_separately);
  RUN_TEST(test_missing_key_rejected_without_publishing);
  RUN_TEST(test_malformed_body_rejected);
  RUN_TEST(test_trailing_whitespace_accepted);
  RUN_TEST(test_null_body_reports_first_missing_key);
  RUN_TEST(test_status_keys_published_sorted);
  RUN_TEST(test_non_object_body_rejected);
  RUN_TEST(test_failed_discovery_is_retried_on_next_request);
  RUN_TEST(test_failed_status_keeps_discovery_mark);
  RUN_TEST(test_defaults_for_topic_and_prefix);
  RUN_TEST(test_custom_prefix_routes_status);
  RUN_TEST(test_custom_discovery_root);
  RUN_TEST(test_extra_fields_pass_through);
  RUN_TEST(test_missing_key_logged_with_client_address);
  RUN_TEST(test_concurrent_requests_announce_once);
  return UNITY_END();
}
