#pragma once

#include <Bridge.h>
#include <IotWebConf.h>
#include <WebServer.h>

#include <cstdint>

void SetupHttpHandlers();

// Webhook listener for MuteDeck, separate from the configuration server.
void SetupBridgeServer(uint16_t port, mutedeck::Bridge* bridge);
void handleBridgeServer();

extern WebServer configServer;
extern IotWebConf iotWebConf;
