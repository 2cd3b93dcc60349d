#include "http.hpp"

#include <Logger.h>
#include <Status.h>

#include <memory>

#include "main.hpp"

WebServer configServer(80);

std::unique_ptr<WebServer> bridgeServer;
mutedeck::Bridge* bridgeHandler = nullptr;

void handleStatus() {
  configServer.send(200, "application/json;charset=utf-8",
                    getStatusJson().c_str());
}

void handleLogData() {
  configServer.send(200, "application/json;charset=utf-8",
                    mutedeck::logger.getLogs().c_str());
}

void handleRoot() {
  // -- Let IotWebConf test and handle captive portal requests.
  if (iotWebConf.handleCaptivePortal()) {
    // -- Captive portal request were already served.
    return;
  }

  String s = "<html><head><title>MuteDeck2MQTT</title>";
  s += "<meta name='viewport' content='width=device-width, initial-scale=1, "
       "user-scalable=no'></head><body>";
  s += "<h3>MuteDeck2MQTT ";
  s += MUTEDECK_VERSION;
  s += "</h3><ul>";
  s += "<li><a href='config'>Configuration</a></li>";
  s += "<li><a href='status'>Status</a></li>";
  s += "<li><a href='logdata'>Log</a></li>";
  s += "<li><a href='restart'>Restart</a></li>";
  s += "</ul></body></html>";
  configServer.send(200, "text/html", s);
}

void SetupHttpHandlers() {
  // -- Set up required URL handlers on the web server.
  configServer.on("/", [] { handleRoot(); });
  configServer.on("/status", [] { handleStatus(); });
  configServer.on("/logdata", [] { handleLogData(); });
  configServer.on("/restart", [] { restart(); });
  configServer.on("/config", [] { iotWebConf.handleConfig(); });
  configServer.onNotFound([]() { iotWebConf.handleNotFound(); });
}

void handleWebhook() {
  mutedeck::Request request;
  request.body = bridgeServer->arg("plain").c_str();
  request.topic = bridgeServer->arg("topic").c_str();
  request.prefix = bridgeServer->arg("prefix").c_str();
  request.clientAddress = mutedeck::clientAddress(
      bridgeServer->header("X-Forwarded-For").c_str(),
      bridgeServer->client().remoteIP().toString().c_str());

  mutedeck::Response response = bridgeHandler->handle(request);
  bridgeServer->send(response.code, "text/plain", response.body.c_str());
}

void SetupBridgeServer(uint16_t port, mutedeck::Bridge* bridge) {
  bridgeHandler = bridge;
  bridgeServer = std::make_unique<WebServer>(port);

  const char* headerKeys[] = {"X-Forwarded-For"};
  bridgeServer->collectHeaders(headerKeys, 1);

  bridgeServer->on("/", HTTP_POST, [] { handleWebhook(); });
  bridgeServer->onNotFound(
      [] { bridgeServer->send(404, "text/plain", "Not found"); });
  bridgeServer->begin();

  mutedeck::logger.info("Listening for MuteDeck on port " +
                        std::to_string(port));
}

void handleBridgeServer() {
  if (bridgeServer) bridgeServer->handleClient();
}
