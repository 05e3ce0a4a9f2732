#pragma once

// gsakit_cli jansen: total-effect indices from radial design outputs
int runAnalyze(int argc, char* argv[]);
