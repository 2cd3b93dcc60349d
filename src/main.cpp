#include "main.hpp"

#include <ArduinoJson.h>
#include <ArduinoOTA.h>
#include <Bridge.h>
#include <Config.h>
#include <DiscoveryCache.h>
#include <ESPmDNS.h>
#include <IotWebConf.h>
#include <IotWebConfESP32HTTPUpdateServer.h>
#include <Lifecycle.h>
#include <Logger.h>
#include <Preferences.h>
#include <Publisher.h>
#include <esp_task_wdt.h>

#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Mqtt.hpp"
#include "http.hpp"

using mutedeck::logger;

HTTPUpdateServer httpUpdater;

Preferences preferences;

// minimum time of reset pin
#define RESET_MS 1000

// mDNS
#define HOSTNAME "mutedeck2mqtt"

// IotWebConf
// adjust this if the iotwebconf structure has changed
#define CONFIG_VERSION "md1"

#define STRING_LEN 64
#define NUMBER_LEN 8

#define DEFAULT_APMODE_PASS "mutedeck"

#define DUMMY_MQTT_SERVER "192.168.1.1"
#define DUMMY_MQTT_USER "roger"
#define DUMMY_MQTT_PASS "password"

DNSServer dnsServer;

char mqtt_server[STRING_LEN];
char mqtt_port[NUMBER_LEN];
char mqtt_user[STRING_LEN];
char mqtt_pass[STRING_LEN];
char mqtt_client_id[STRING_LEN];

char ha_prefix[STRING_LEN];

char log_level[NUMBER_LEN];
static char log_level_values[][NUMBER_LEN] = {"DEBUG", "INFO", "WARN",
                                              "ERROR"};

char http_port[NUMBER_LEN];

IotWebConf iotWebConf(HOSTNAME, &dnsServer, &configServer, DEFAULT_APMODE_PASS,
                      CONFIG_VERSION);

iotwebconf::ParameterGroup mqttGroup =
    iotwebconf::ParameterGroup("mqtt", "MQTT configuration");
iotwebconf::TextParameter mqttServerParam =
    iotwebconf::TextParameter("MQTT server", "mqtt_server", mqtt_server,
                              STRING_LEN, "", DUMMY_MQTT_SERVER);
iotwebconf::NumberParameter mqttPortParam = iotwebconf::NumberParameter(
    "MQTT port", "mqtt_port", mqtt_port, NUMBER_LEN, "1883", "1..65535",
    "min='1' max='65535' step='1'");
iotwebconf::TextParameter mqttUserParam = iotwebconf::TextParameter(
    "MQTT user", "mqtt_user", mqtt_user, STRING_LEN, "", DUMMY_MQTT_USER);
iotwebconf::PasswordParameter mqttPasswordParam = iotwebconf::PasswordParameter(
    "MQTT password", "mqtt_pass", mqtt_pass, STRING_LEN, "", DUMMY_MQTT_PASS);
iotwebconf::TextParameter mqttClientIdParam =
    iotwebconf::TextParameter("MQTT client id", "mqtt_client_id",
                              mqtt_client_id, STRING_LEN, "mutedeck2mqtt");

iotwebconf::ParameterGroup haGroup =
    iotwebconf::ParameterGroup("ha", "Home Assistant configuration");
iotwebconf::TextParameter haPrefixParam =
    iotwebconf::TextParameter("Discovery prefix", "ha_prefix", ha_prefix,
                              STRING_LEN, "homeassistant");

iotwebconf::ParameterGroup bridgeGroup =
    iotwebconf::ParameterGroup("bridge", "MuteDeck bridge");
iotwebconf::NumberParameter httpPortParam = iotwebconf::NumberParameter(
    "Webhook port", "http_port", http_port, NUMBER_LEN, "8080", "1..65535",
    "min='1' max='65535' step='1'");
iotwebconf::SelectParameter logLevelParam = iotwebconf::SelectParameter(
    "Log level", "log_level", log_level, NUMBER_LEN,
    reinterpret_cast<char*>(log_level_values),
    reinterpret_cast<char*>(log_level_values),
    sizeof(log_level_values) / NUMBER_LEN, NUMBER_LEN, "INFO");

mutedeck::Config config;

mutedeck::DiscoveryCache discoveryCache;
mutedeck::Publisher publisher(&mqtt);
mutedeck::Lifecycle lifecycle(&discoveryCache, &publisher);
std::unique_ptr<mutedeck::Bridge> bridge;

// mqtt
bool needMqttConnect = false;
int mqtt_reconnect_count = 0;
uint32_t lastMqttConnectionAttempt = 0;

bool connectMqtt() {
  if (mqtt.connected()) return true;

  if (1000 > millis() - lastMqttConnectionAttempt) return false;

  mqtt.connect();

  if (!mqtt.connected()) {
    lastMqttConnectionAttempt = millis();
    return false;
  }

  return true;
}

void wifiConnected() { needMqttConnect = true; }

void wdt_start() { esp_task_wdt_init(6, true); }

void wdt_feed() { esp_task_wdt_reset(); }

void restart() { ESP.restart(); }

void check_reset() {
#if defined(RESET_PIN)
  // check if RESET_PIN being hold low and reset
  pinMode(RESET_PIN, INPUT_PULLUP);
  uint32_t resetStart = millis();
  while (digitalRead(RESET_PIN) == 0) {
    if (millis() > resetStart + RESET_MS) {
      preferences.clear();
      restart();
    }
  }
#endif
}

mutedeck::Config buildConfig() {
  mutedeck::Config c;
  c.mqttHost = mqtt_server;
  mutedeck::parsePort(mqtt_port, &c.mqttPort);
  c.mqttUser = mqtt_user;
  c.mqttPass = mqtt_pass;
  if (strlen(mqtt_client_id) > 0) c.clientId = mqtt_client_id;
  if (strlen(ha_prefix) > 0) c.discoveryPrefix = ha_prefix;
  c.logLevel = mutedeck::parseLogLevel(log_level);
  mutedeck::parsePort(http_port, &c.httpPort);
  return c;
}

bool formValidator(iotwebconf::WebRequestWrapper* webRequestWrapper) {
  mutedeck::FormValues values;
  values.mqttServer = webRequestWrapper->arg(mqttServerParam.getId()).c_str();
  values.mqttPort = webRequestWrapper->arg(mqttPortParam.getId()).c_str();
  values.mqttUser = webRequestWrapper->arg(mqttUserParam.getId()).c_str();
  values.mqttPass = webRequestWrapper->arg(mqttPasswordParam.getId()).c_str();
  values.storedPass = mqtt_pass;
  values.httpPort = webRequestWrapper->arg(httpPortParam.getId()).c_str();

  std::map<std::string, const char*> errors = mutedeck::validateForm(values);

  iotwebconf::Parameter* params[] = {&mqttServerParam, &mqttPortParam,
                                     &mqttUserParam, &mqttPasswordParam,
                                     &httpPortParam};
  for (iotwebconf::Parameter* param : params) {
    auto it = errors.find(param->getId());
    if (it != errors.end()) param->errorMessage = it->second;
  }

  return errors.empty();
}

void saveParamsCallback() {
  // broker and listener changes are picked up after a restart
  config.logLevel = mutedeck::parseLogLevel(log_level);
  logger.setLevel(config.logLevel);
  logger.info(std::string("Log level set to ") +
              mutedeck::logLevelText(config.logLevel));
}

bool startBridge() {
  std::vector<std::string> missing = config.missing();
  if (!missing.empty()) {
    std::string names;
    for (const std::string& name : missing)
      names += (names.empty() ? "" : ", ") + name;
    logger.error("Missing configuration: " + names);
    return false;
  }

  logger.info("Using MQTT server: " + config.mqttHost);

  mqtt.setClientId(config.clientId);
  mqtt.setServer(config.mqttHost, config.mqttPort);
  mqtt.setCredentials(config.mqttUser, config.mqttPass);
  mqtt.setLifecycle(&lifecycle);

  bridge = std::make_unique<mutedeck::Bridge>(&discoveryCache, &publisher,
                                              config.discoveryPrefix);
  SetupBridgeServer(config.httpPort, bridge.get());

  needMqttConnect = true;
  return true;
}

const std::string getStatusJson() {
  std::string payload;
  JsonDocument doc;

  JsonObject Status = doc["Status"].to<JsonObject>();
  Status["Uptime"] = millis();
  Status["Free_Heap"] = ESP.getFreeHeap();

  JsonObject Firmware = doc["Firmware"].to<JsonObject>();
  Firmware["Version"] = MUTEDECK_VERSION;
  Firmware["SDK"] = ESP.getSdkVersion();

  JsonObject MQTT = doc["MQTT"].to<JsonObject>();
  MQTT["Server"] = config.mqttHost;
  MQTT["Port"] = config.mqttPort;
  MQTT["User"] = config.mqttUser;
  MQTT["Client_Id"] = config.clientId;
  MQTT["Connected"] = mqtt.connected();
  MQTT["Reconnect_Count"] = mqtt_reconnect_count;

  JsonObject HomeAssistant = doc["Home_Assistant"].to<JsonObject>();
  HomeAssistant["Discovery_Prefix"] = config.discoveryPrefix;
  HomeAssistant["State"] = mutedeck::consumerStateText(lifecycle.getState());
  {
    std::unique_lock<std::mutex> lock = discoveryCache.lock();
    HomeAssistant["Discovery_Topics"] = discoveryCache.size();
  }

  JsonObject Webhook = doc["Webhook"].to<JsonObject>();
  Webhook["Running"] = bridge != nullptr;
  Webhook["Http_Port"] = config.httpPort;
  Webhook["Log_Level"] = mutedeck::logLevelText(logger.getLevel());

  doc.shrinkToFit();
  serializeJson(doc, payload);

  return payload;
}

void setup() {
  Serial.begin(115200);

  logger.setSink(
      [](const std::string& entry) { Serial.println(entry.c_str()); });

  preferences.begin("mutedeck2mqtt", false);

  check_reset();

  // IotWebConf
  mqttGroup.addItem(&mqttServerParam);
  mqttGroup.addItem(&mqttPortParam);
  mqttGroup.addItem(&mqttUserParam);
  mqttGroup.addItem(&mqttPasswordParam);
  mqttGroup.addItem(&mqttClientIdParam);

  haGroup.addItem(&haPrefixParam);

  bridgeGroup.addItem(&httpPortParam);
  bridgeGroup.addItem(&logLevelParam);

  iotWebConf.addParameterGroup(&mqttGroup);
  iotWebConf.addParameterGroup(&haGroup);
  iotWebConf.addParameterGroup(&bridgeGroup);
  iotWebConf.setFormValidator(&formValidator);
  iotWebConf.setConfigSavedCallback(&saveParamsCallback);
  iotWebConf.getApTimeoutParameter()->visible = true;
  iotWebConf.setWifiConnectionTimeoutMs(7000);
  iotWebConf.setWifiConnectionCallback(&wifiConnected);

#if defined(STATUS_LED_PIN)
  iotWebConf.setStatusPin(STATUS_LED_PIN);
#endif

  if (preferences.getBool("firstboot", true)) {
    preferences.putBool("firstboot", false);

    iotWebConf.init();
    strncpy(iotWebConf.getApPasswordParameter()->valueBuffer,
            DEFAULT_APMODE_PASS, IOTWEBCONF_WORD_LEN);
    iotWebConf.saveConfig();
  } else {
    iotWebConf.skipApStartup();
    // -- Initializing the configuration.
    iotWebConf.init();
  }

  SetupHttpHandlers();

  iotWebConf.setupUpdateServer(
      [](const char* updatePath) {
        httpUpdater.setup(&configServer, updatePath);
      },
      [](const char* userName, char* password) {
        httpUpdater.updateCredentials(userName, password);
      });

  while (iotWebConf.getState() != iotwebconf::NetworkState::OnLine) {
    iotWebConf.doLoop();
  }

  config = buildConfig();
  logger.setLevel(config.logLevel);

  // without a broker configuration only the portal is served
  if (!startBridge()) logger.warn("MuteDeck bridge not started");

  ArduinoOTA.onStart([]() { mqtt.disconnect(); });
  ArduinoOTA.begin();
  MDNS.begin(HOSTNAME);
  wdt_start();
}

void loop() {
  ArduinoOTA.handle();

  wdt_feed();

  iotWebConf.doLoop();

  if (bridge == nullptr) return;

  if (needMqttConnect) {
    if (connectMqtt()) {
      needMqttConnect = false;
      ++mqtt_reconnect_count;
    }

  } else if ((iotWebConf.getState() == iotwebconf::OnLine) &&
             (!mqtt.connected())) {
    needMqttConnect = true;
  }

  handleBridgeServer();
}
