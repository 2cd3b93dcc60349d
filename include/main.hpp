#pragma once

#include <string>

void restart();
const std::string getStatusJson();
