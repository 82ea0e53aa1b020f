#pragma once

#include <string>

std::string UsageText(const char *argv0);
