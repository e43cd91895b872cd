#pragma once

// newscheckr analyze (--url <u> | --text <t> | --file <path>) [options]
int cmd_analyze(int argc, char** argv);
