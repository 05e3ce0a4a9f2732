#pragma once

#include <string>

// gsakit_cli latin|radial: generate a design from a problem config
int runSample(int argc, char* argv[], const std::string& method);
